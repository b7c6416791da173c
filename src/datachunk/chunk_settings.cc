#include "datachunk/chunk_settings.h"

#include "text_internal.h"

#include <cctype>

namespace datachunk {
namespace {

    static ChunkStatus invalid(ChunkError* error, std::string_view key,
                               std::string_view message) noexcept
    {
        if (error) {
            error->fragment.assign(key.data(), key.size());
        }
        return set_chunk_error(error, ChunkStatus::InvalidArguments, message);
    }


    // String literal, or a bare name token taken as-is.
    static bool read_word(std::string_view raw, std::string* out)
    {
        raw = text_internal::trim_blank(raw);
        if (option_string_value(raw, out)) {
            return true;
        }
        if (!text_internal::is_name(raw)) {
            return false;
        }
        out->assign(raw.data(), raw.size());
        return true;
    }


    static bool is_hex_digest(std::string_view s) noexcept
    {
        if (s.size() != 32U) {
            return false;
        }
        for (char c : s) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }


    static bool read_u32(std::string_view raw, uint32_t* out) noexcept
    {
        raw = text_internal::trim_blank(raw);
        // Accept R integer literals such as `5L`.
        if (!raw.empty() && raw.back() == 'L') {
            raw.remove_suffix(1);
        }
        if (raw.empty() || raw.size() > 10U) {
            return false;
        }
        uint64_t v = 0;
        for (char c : raw) {
            if (c < '0' || c > '9') {
                return false;
            }
            v = v * 10U + static_cast<uint64_t>(c - '0');
        }
        if (v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

}  // namespace

ChunkStatus
resolve_chunk_settings(const ChunkOptions& options, ChunkSettings* out,
                       ChunkError* error) noexcept
{
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null settings output");
    }
    *out = ChunkSettings {};

    std::string word;
    if (const std::string* v = options.find("format")) {
        if (!read_word(*v, &word) || !parse_payload_format(word, &out->format)) {
            return invalid(error, "format",
                           "format must be \"text\" or \"binary\"");
        }
    }
    if (const std::string* v = options.find("encoding")) {
        if (!read_word(*v, &word)
            || !parse_payload_encoding(word, &out->encoding)) {
            return invalid(error, "encoding",
                           "encoding must be \"asis\" or \"base64\"");
        }
    }
    if (const std::string* v = options.find("output.var")) {
        if (!read_word(*v, &out->output_var) || out->output_var.empty()) {
            return invalid(error, "output.var",
                           "output.var must be a variable name");
        }
    }
    if (const std::string* v = options.find("output.file")) {
        if (!option_string_value(*v, &out->output_file)
            || out->output_file.empty()) {
            return invalid(error, "output.file",
                           "output.file must be a quoted path");
        }
    }
    if (const std::string* v = options.find("loader.function")) {
        out->loader_function = *v;
        if (out->output_var.empty()) {
            return invalid(error, "loader.function",
                           "loader.function requires output.var");
        }
    }
    if (const std::string* v = options.find("loader.ops")) {
        out->loader_ops = *v;
    }
    if (const std::string* v = options.find("md5sum")) {
        if (!option_string_value(*v, &out->md5sum)
            || !is_hex_digest(out->md5sum)) {
            return invalid(error, "md5sum",
                           "md5sum must be a quoted 32-digit hex digest");
        }
    }
    if (const std::string* v = options.find("echo")) {
        if (!option_bool_value(*v, &out->echo)) {
            return invalid(error, "echo", "echo must be TRUE or FALSE");
        }
    }
    if (const std::string* v = options.find("max.echo")) {
        if (!read_u32(*v, &out->max_echo)) {
            return invalid(error, "max.echo",
                           "max.echo must be a non-negative integer");
        }
    }
    if (const std::string* v = options.find("eval")) {
        out->eval = *v;
    }
    return ChunkStatus::Ok;
}

}  // namespace datachunk
