#include "datachunk/chunk_assemble.h"

#include "datachunk/binary_sniff.h"
#include "datachunk/chunk_header.h"
#include "datachunk/chunk_options.h"
#include "datachunk/payload_digest.h"
#include "text_internal.h"

#include <algorithm>

namespace datachunk {
namespace {

    static ChunkStatus invalid(ChunkError* error, std::string_view fragment,
                               std::string_view message) noexcept
    {
        if (error) {
            error->fragment.assign(fragment.data(), fragment.size());
        }
        return set_chunk_error(error, ChunkStatus::InvalidArguments, message);
    }


    static bool is_label_token(std::string_view s) noexcept
    {
        for (char c : s) {
            if (text_internal::is_blank(c) || c == ',' || c == '{' || c == '}'
                || c == '"' || c == '\'' || c == '`' || c == '='
                || c == '\n' || c == '\r') {
                return false;
            }
        }
        return true;
    }


    static bool is_single_line(std::string_view s) noexcept
    {
        return s.find_first_of("\r\n") == std::string_view::npos;
    }


    // Keys the assembler writes itself.
    static bool conflicts(const ChunkAssembleRequest& request,
                          std::string_view key) noexcept
    {
        if (key == "format" || key == "encoding" || key == "echo") {
            return true;
        }
        if (key == "label") {
            return !request.label.empty();
        }
        if (key == "output.var") {
            return !request.output_var.empty();
        }
        if (key == "output.file") {
            return !request.output_file.empty();
        }
        if (key == "loader.function") {
            return !request.loader_function.empty();
        }
        if (key == "md5sum") {
            return request.md5sum;
        }
        if (key == "eval") {
            return !request.eval.empty();
        }
        return false;
    }

}  // namespace

ChunkStatus
assemble_chunk(std::span<const std::byte> payload,
               const ChunkAssembleRequest& request,
               const AssembleOptions& options,
               std::vector<std::string>* out_lines, ChunkError* error) noexcept
{
    if (!out_lines) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null output lines");
    }
    out_lines->clear();
    clear_chunk_error(error);
    if (error) {
        error->label = request.label;
    }

    if (!text_internal::is_name(options.engine)) {
        return invalid(error, options.engine, "bad engine name");
    }
    if (!is_label_token(request.label)) {
        return invalid(error, request.label, "label must be a single token");
    }
    if (!request.loader_function.empty() && request.output_var.empty()) {
        return invalid(error, "loader.function",
                       "loader function requires an output variable");
    }
    if (!request.output_var.empty() && !text_internal::is_name(request.output_var)) {
        return invalid(error, request.output_var, "bad output variable name");
    }
    if (!is_single_line(request.loader_function) || !is_single_line(request.eval)
        || !is_single_line(request.extra_options)) {
        return invalid(error, "", "option values must fit on one line");
    }

    ChunkOptions extra;
    const ChunkStatus est = parse_chunk_option_list(request.extra_options,
                                                    &extra, error);
    if (est != ChunkStatus::Ok) {
        return est;
    }
    for (const ChunkOption& e : extra.entries()) {
        if (conflicts(request, e.key)) {
            return invalid(error, e.key, "option given twice");
        }
    }

    PayloadFormat format = request.format;
    if (format == PayloadFormat::Auto) {
        // Text below the sniff threshold may still hold invalid UTF-8.
        format = (is_binary(payload, options.encode.sniff)
                  || !is_asis_text(payload))
                     ? PayloadFormat::Binary
                     : PayloadFormat::Text;
    }
    PayloadEncoding encoding = request.encoding;
    if (encoding == PayloadEncoding::Auto) {
        encoding = (format == PayloadFormat::Binary) ? PayloadEncoding::Base64
                                                     : PayloadEncoding::Asis;
    }
    if (format == PayloadFormat::Text && !is_asis_text(payload)) {
        return set_chunk_error(error, ChunkStatus::InvalidEncodingChoice,
                               "format=\"text\" but payload is not UTF-8 text");
    }

    std::vector<std::string> body;
    const ChunkStatus pst = encode_payload(payload, encoding, options.encode,
                                           &body, error);
    if (pst != ChunkStatus::Ok) {
        return pst;
    }

    ChunkOptions opts;
    opts.set("format", quote_option_string(payload_format_name(format)));
    opts.set("encoding", quote_option_string(payload_encoding_name(encoding)));
    if (!request.output_var.empty()) {
        opts.set("output.var", quote_option_string(request.output_var));
    }
    if (!request.output_file.empty()) {
        opts.set("output.file", quote_option_string(request.output_file));
    }
    if (!request.loader_function.empty()) {
        opts.set("loader.function",
                 text_internal::trim_blank(request.loader_function));
    }
    if (request.md5sum) {
        // `asis` normalizes line endings; hash what decoding rebuilds.
        std::vector<std::byte> rebuilt;
        std::span<const std::byte> hashed = payload;
        if (encoding == PayloadEncoding::Asis) {
            const ChunkStatus dst = decode_payload(body, encoding, &rebuilt,
                                                   error);
            if (dst != ChunkStatus::Ok) {
                return dst;
            }
            hashed = rebuilt;
        }
        std::string digest;
        if (!payload_digest_hex(hashed, &digest)) {
            return set_chunk_error(error, ChunkStatus::ChecksumMismatch,
                                   "digest backend failure");
        }
        opts.set("md5sum", quote_option_string(digest));
    }
    opts.set("echo", request.echo ? "TRUE" : "FALSE");
    if (!request.eval.empty()) {
        opts.set("eval", text_internal::trim_blank(request.eval));
    }
    for (const ChunkOption& e : extra.entries()) {
        opts.set(e.key, e.value);
    }

    size_t longest = 0;
    for (const std::string& line : body) {
        longest = std::max(longest, text_internal::leading_backtick_run(line));
    }
    const size_t ticks = std::max(kMinFenceBackticks, longest + 1U);
    const std::string fence = make_fence(ticks);

    std::string header_line = fence;
    header_line.append(serialize_chunk_header(options.engine, request.label,
                                              opts));

    // Code values are not quoted by us; make sure the header reads back.
    ChunkHeader check;
    ChunkError check_error;
    if (parse_chunk_header(header_line, &check, &check_error)
        != ChunkStatus::Ok) {
        if (error) {
            error->fragment = std::move(check_error.fragment);
        }
        return set_chunk_error(error, ChunkStatus::MalformedHeader,
                               check_error.message);
    }

    out_lines->reserve(body.size() + 2U);
    out_lines->push_back(std::move(header_line));
    for (std::string& line : body) {
        out_lines->push_back(std::move(line));
    }
    out_lines->push_back(fence);
    return ChunkStatus::Ok;
}

}  // namespace datachunk
