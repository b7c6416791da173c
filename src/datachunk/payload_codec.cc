#include "datachunk/payload_codec.h"

#include "text_internal.h"

#include <cstdio>

namespace datachunk {
namespace {

    static constexpr char kBase64Alphabet[]
        = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    static int8_t base64_value(char c) noexcept
    {
        if (c >= 'A' && c <= 'Z') {
            return static_cast<int8_t>(c - 'A');
        }
        if (c >= 'a' && c <= 'z') {
            return static_cast<int8_t>(c - 'a' + 26);
        }
        if (c >= '0' && c <= '9') {
            return static_cast<int8_t>(c - '0' + 52);
        }
        if (c == '+') {
            return 62;
        }
        if (c == '/') {
            return 63;
        }
        return -1;
    }


    static bool is_base64_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'
               || c == '\v';
    }


    // Emits base64 into fixed-width lines as bytes are appended.
    struct Base64LineWriter final {
        std::vector<std::string>* lines = nullptr;
        uint32_t width                  = 0;
        std::string current;
        uint8_t buf[3]    = { 0, 0, 0 };
        uint32_t buffered = 0;

        Base64LineWriter(std::vector<std::string>* out, uint32_t line_width)
            : lines(out)
            , width(line_width)
        {
        }

        void put(char c)
        {
            current.push_back(c);
            if (width != 0U && current.size() == width) {
                lines->push_back(std::move(current));
                current.clear();
            }
        }

        void emit(uint8_t a, uint8_t b, uint8_t c, uint32_t n)
        {
            put(kBase64Alphabet[(a >> 2) & 0x3F]);
            put(kBase64Alphabet[((a & 0x03) << 4) | ((b >> 4) & 0x0F)]);
            put(n > 1U ? kBase64Alphabet[((b & 0x0F) << 2) | ((c >> 6) & 0x03)]
                       : '=');
            put(n > 2U ? kBase64Alphabet[c & 0x3F] : '=');
        }

        void append(std::span<const std::byte> bytes)
        {
            for (size_t i = 0; i < bytes.size(); ++i) {
                buf[buffered] = static_cast<uint8_t>(bytes[i]);
                buffered += 1;
                if (buffered == 3U) {
                    emit(buf[0], buf[1], buf[2], 3);
                    buffered = 0;
                }
            }
        }

        void finish()
        {
            if (buffered == 1U) {
                emit(buf[0], 0, 0, 1);
            } else if (buffered == 2U) {
                emit(buf[0], buf[1], 0, 2);
            }
            buffered = 0;
            if (!current.empty()) {
                lines->push_back(std::move(current));
                current.clear();
            }
        }
    };


    // Incremental strict base64 decoder; whitespace is ignored between
    // characters, padding may only complete the final quartet.
    struct Base64Decoder final {
        std::vector<std::byte>* out = nullptr;
        uint8_t quad[4]             = { 0, 0, 0, 0 };
        uint32_t filled             = 0;
        uint32_t pads               = 0;
        bool finished               = false;

        explicit Base64Decoder(std::vector<std::byte>* dst) noexcept
            : out(dst)
        {
        }

        // Returns npos on success, else the offset of the offending char.
        size_t feed(std::string_view text)
        {
            for (size_t i = 0; i < text.size(); ++i) {
                const char c = text[i];
                if (is_base64_space(c)) {
                    continue;
                }
                if (finished) {
                    return i;
                }
                if (c == '=') {
                    // "x===" and "===="-style padding is never valid.
                    if (filled < 2U) {
                        return i;
                    }
                    pads += 1;
                    quad[filled] = 0;
                    filled += 1;
                } else {
                    const int8_t v = base64_value(c);
                    if (v < 0 || pads != 0U) {
                        return i;
                    }
                    quad[filled] = static_cast<uint8_t>(v);
                    filled += 1;
                }
                if (filled == 4U) {
                    flush();
                }
            }
            return std::string_view::npos;
        }

        void flush()
        {
            const uint32_t bits = (static_cast<uint32_t>(quad[0]) << 18)
                                  | (static_cast<uint32_t>(quad[1]) << 12)
                                  | (static_cast<uint32_t>(quad[2]) << 6)
                                  | static_cast<uint32_t>(quad[3]);
            out->push_back(std::byte { static_cast<uint8_t>((bits >> 16) & 0xFF) });
            if (pads < 2U) {
                out->push_back(
                    std::byte { static_cast<uint8_t>((bits >> 8) & 0xFF) });
            }
            if (pads < 1U) {
                out->push_back(std::byte { static_cast<uint8_t>(bits & 0xFF) });
            }
            if (pads != 0U) {
                finished = true;
            }
            filled = 0;
        }

        bool complete() const noexcept { return filled == 0U; }
    };


    static void split_text_lines(std::span<const std::byte> bytes,
                                 std::vector<std::string>* out)
    {
        std::string current;
        bool line_open = false;
        for (size_t i = 0; i < bytes.size(); ++i) {
            const char c = static_cast<char>(bytes[i]);
            if (c == '\r' || c == '\n') {
                if (c == '\r' && i + 1 < bytes.size()
                    && static_cast<char>(bytes[i + 1]) == '\n') {
                    i += 1;
                }
                out->push_back(std::move(current));
                current.clear();
                line_open = false;
                continue;
            }
            current.push_back(c);
            line_open = true;
        }
        if (line_open) {
            out->push_back(std::move(current));
        }
    }

}  // namespace

const char*
payload_format_name(PayloadFormat format) noexcept
{
    switch (format) {
    case PayloadFormat::Auto: return "auto";
    case PayloadFormat::Text: return "text";
    case PayloadFormat::Binary: return "binary";
    }
    return "auto";
}


const char*
payload_encoding_name(PayloadEncoding encoding) noexcept
{
    switch (encoding) {
    case PayloadEncoding::Auto: return "auto";
    case PayloadEncoding::Asis: return "asis";
    case PayloadEncoding::Base64: return "base64";
    }
    return "auto";
}


bool
parse_payload_format(std::string_view s, PayloadFormat* out) noexcept
{
    if (s == "text") {
        *out = PayloadFormat::Text;
        return true;
    }
    if (s == "binary") {
        *out = PayloadFormat::Binary;
        return true;
    }
    return false;
}


bool
parse_payload_encoding(std::string_view s, PayloadEncoding* out) noexcept
{
    if (s == "asis") {
        *out = PayloadEncoding::Asis;
        return true;
    }
    if (s == "base64") {
        *out = PayloadEncoding::Base64;
        return true;
    }
    return false;
}


bool
is_asis_text(std::span<const std::byte> bytes) noexcept
{
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t c = static_cast<uint8_t>(bytes[i]);
        if (c == 0x00U) {
            return false;
        }
        if (c < 0x80U) {
            i += 1;
            continue;
        }
        uint32_t len = 0;
        if (text_internal::utf8_step(bytes, i, &len)
            != text_internal::Utf8Step::Valid) {
            return false;
        }
        i += len;
    }
    return true;
}


ChunkStatus
encode_payload(std::span<const std::byte> bytes, PayloadEncoding encoding,
               const EncodeOptions& options,
               std::vector<std::string>* out_lines, ChunkError* error) noexcept
{
    if (!out_lines) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null output lines");
    }
    out_lines->clear();

    if (encoding == PayloadEncoding::Auto) {
        encoding = is_binary(bytes, options.sniff) ? PayloadEncoding::Base64
                                                   : PayloadEncoding::Asis;
    }

    if (encoding == PayloadEncoding::Asis) {
        if (!is_asis_text(bytes)) {
            return set_chunk_error(
                error, ChunkStatus::InvalidEncodingChoice,
                "payload is not UTF-8 text; use encoding=\"base64\"");
        }
        split_text_lines(bytes, out_lines);
        return ChunkStatus::Ok;
    }

    if (options.line_width % 4U != 0U) {
        if (error) {
            char buf[24];
            std::snprintf(buf, sizeof(buf), "line_width=%u",
                          static_cast<unsigned>(options.line_width));
            error->fragment = buf;
        }
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "base64 line width must be a multiple of 4");
    }

    out_lines->reserve(options.line_width == 0U
                           ? 1U
                           : (bytes.size() / 3U * 4U) / options.line_width + 1U);
    Base64LineWriter writer(out_lines, options.line_width);
    // Bounded blocks keep the working set small for large payloads.
    static constexpr size_t kBlock = 48U * 1024U;
    for (size_t off = 0; off < bytes.size(); off += kBlock) {
        const size_t n = (bytes.size() - off < kBlock) ? bytes.size() - off
                                                       : kBlock;
        writer.append(bytes.subspan(off, n));
    }
    writer.finish();
    return ChunkStatus::Ok;
}


ChunkStatus
decode_payload(std::span<const std::string> lines, PayloadEncoding encoding,
               std::vector<std::byte>* out, ChunkError* error) noexcept
{
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null output buffer");
    }
    out->clear();

    if (encoding == PayloadEncoding::Asis) {
        size_t total = 0;
        for (const std::string& line : lines) {
            total += line.size() + 1U;
        }
        out->reserve(total);
        for (const std::string& line : lines) {
            const std::span<const std::byte> b = text_internal::as_bytes(line);
            out->insert(out->end(), b.begin(), b.end());
            out->push_back(std::byte { '\n' });
        }
        return ChunkStatus::Ok;
    }

    if (encoding != PayloadEncoding::Base64) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "payload encoding must be asis or base64");
    }

    size_t chars = 0;
    for (const std::string& line : lines) {
        chars += line.size();
    }
    out->reserve(chars / 4U * 3U);

    Base64Decoder decoder(out);
    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t bad = decoder.feed(lines[i]);
        if (bad != std::string_view::npos) {
            out->clear();
            if (error) {
                char buf[64];
                std::snprintf(buf, sizeof(buf), "body line %zu column %zu",
                              i + 1U, bad + 1U);
                error->fragment = buf;
            }
            return set_chunk_error(error, ChunkStatus::CorruptPayload,
                                   "invalid base64 data");
        }
    }
    if (!decoder.complete()) {
        out->clear();
        return set_chunk_error(error, ChunkStatus::CorruptPayload,
                               "base64 data ends inside a 4-character group");
    }
    return ChunkStatus::Ok;
}


void
append_base64(std::span<const std::byte> bytes, std::string* out) noexcept
{
    if (!out) {
        return;
    }
    std::vector<std::string> lines;
    Base64LineWriter writer(&lines, 0);
    writer.append(bytes);
    writer.finish();
    if (!lines.empty()) {
        out->append(lines.front());
    }
}


bool
decode_base64(std::string_view text, std::vector<std::byte>* out,
              size_t* out_bad_offset) noexcept
{
    if (!out) {
        return false;
    }
    Base64Decoder decoder(out);
    const size_t bad = decoder.feed(text);
    if (bad != std::string_view::npos) {
        if (out_bad_offset) {
            *out_bad_offset = bad;
        }
        return false;
    }
    if (!decoder.complete()) {
        if (out_bad_offset) {
            *out_bad_offset = text.size();
        }
        return false;
    }
    return true;
}

}  // namespace datachunk
