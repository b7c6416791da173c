#include "datachunk/chunk_request.h"

#include "datachunk/chunk_decode.h"
#include "datachunk/chunk_options.h"
#include "datachunk/document_splice.h"
#include "datachunk/payload_codec.h"
#include "text_internal.h"

namespace datachunk {
namespace {

    static ChunkStatus invalid(ChunkError* error, ChunkStatus status,
                               std::string_view fragment,
                               std::string_view message) noexcept
    {
        if (error) {
            error->fragment.assign(fragment.data(), fragment.size());
        }
        return set_chunk_error(error, status, message);
    }


    static bool extension_is(std::string_view path,
                             std::string_view ext) noexcept
    {
        const size_t dot = path.find_last_of('.');
        const size_t sep = path.find_last_of("/\\");
        if (dot == std::string_view::npos
            || (sep != std::string_view::npos && dot < sep)) {
            return false;
        }
        const std::string_view got = path.substr(dot + 1U);
        if (got.size() != ext.size()) {
            return false;
        }
        for (size_t i = 0; i < got.size(); ++i) {
            char c = got[i];
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            if (c != ext[i]) {
                return false;
            }
        }
        return true;
    }

}  // namespace

ChunkStatus
check_chunk_targets(const ChunkAssembleRequest& request,
                    ChunkError* error) noexcept
{
    if (request.output_var.empty() && request.output_file.empty()) {
        return invalid(error, ChunkStatus::InvalidArguments, "output",
                       "an output variable or an output file is required");
    }
    return ChunkStatus::Ok;
}


std::string_view
guess_loader_function(std::string_view data_path) noexcept
{
    if (extension_is(data_path, "csv")) {
        return "read.csv";
    }
    if (extension_is(data_path, "rds")) {
        return "readRDS";
    }
    return {};
}


std::string
file_exists_guard(std::string_view path)
{
    return "!file.exists(" + quote_option_string(path) + ")";
}


ChunkStatus
apply_chunk_request_defaults(std::span<const std::byte> payload,
                             std::string_view data_path,
                             const SniffOptions& sniff, ChunkRequestDraft* draft,
                             ChunkError* error) noexcept
{
    clear_chunk_error(error);
    if (!draft) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null request");
    }
    ChunkAssembleRequest& r = draft->request;
    const ChunkStatus st    = check_chunk_targets(r, error);
    if (st != ChunkStatus::Ok) {
        return st;
    }

    const bool binary = is_binary(payload, sniff) || !is_asis_text(payload);
    if (!draft->have_format) {
        r.format = binary ? PayloadFormat::Binary : PayloadFormat::Text;
    }
    if (!draft->have_encoding) {
        r.encoding = binary ? PayloadEncoding::Base64 : PayloadEncoding::Asis;
    }
    if (!draft->have_loader && !r.output_var.empty()) {
        r.loader_function = guess_loader_function(data_path);
    }
    if (!r.loader_function.empty() && r.output_var.empty()) {
        return invalid(error, ChunkStatus::InvalidArguments, "loader.function",
                       "a loader function needs an output variable");
    }
    if (!draft->have_eval && !r.output_file.empty()) {
        r.eval = file_exists_guard(r.output_file);
    }
    return ChunkStatus::Ok;
}


ChunkStatus
parse_line_number(std::string_view text, uint64_t* out_index,
                  ChunkError* error) noexcept
{
    clear_chunk_error(error);
    uint64_t n = 0;
    if (!text_internal::parse_decimal_u64(text, &n) || n == 0
        || n > static_cast<uint64_t>(INT64_MAX)) {
        return invalid(error, ChunkStatus::InvalidPosition, text,
                       "line numbers are positive decimal numbers");
    }
    *out_index = n - 1U;
    return ChunkStatus::Ok;
}


ChunkStatus
parse_chunk_selector(std::string_view text, ChunkSelector* out,
                     ChunkError* error) noexcept
{
    clear_chunk_error(error);
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null selector");
    }
    *out = ChunkSelector {};

    if (!text.empty() && text.front() == '#') {
        uint64_t n = 0;
        if (!text_internal::parse_decimal_u64(text.substr(1), &n) || n == 0) {
            return invalid(error, ChunkStatus::InvalidArguments, text,
                           "chunk index must be a positive number");
        }
        out->kind  = ChunkSelectorKind::Index;
        out->index = n - 1U;
        return ChunkStatus::Ok;
    }

    const size_t colon = text.find(':');
    uint64_t first     = 0;
    uint64_t last      = 0;
    if (colon != std::string_view::npos
        && text_internal::parse_decimal_u64(text.substr(0, colon), &first)
        && text_internal::parse_decimal_u64(text.substr(colon + 1U), &last)) {
        if (first == 0 || last == 0) {
            return invalid(error, ChunkStatus::InvalidPosition, text,
                           "line numbers start at 1");
        }
        out->kind       = ChunkSelectorKind::Lines;
        out->first_line = first - 1U;
        out->last_line  = last - 1U;
        return ChunkStatus::Ok;
    }

    if (text.empty()) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "empty chunk selector");
    }
    out->kind = ChunkSelectorKind::Label;
    out->label.assign(text.data(), text.size());
    return ChunkStatus::Ok;
}


ChunkStatus
select_chunks(std::span<const Chunk> chunks, const ChunkSelector& selector,
              std::vector<size_t>* out, ChunkError* error) noexcept
{
    clear_chunk_error(error);
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null output");
    }
    switch (selector.kind) {
    case ChunkSelectorKind::Index:
        if (selector.index >= chunks.size()) {
            return invalid(error, ChunkStatus::InvalidArguments,
                           "#" + std::to_string(selector.index + 1U),
                           "no such chunk");
        }
        out->push_back(static_cast<size_t>(selector.index));
        return ChunkStatus::Ok;
    case ChunkSelectorKind::Lines: {
        const std::vector<size_t> hits = find_chunks_in_selection(
            chunks, selector.first_line, selector.last_line);
        out->insert(out->end(), hits.begin(), hits.end());
        return ChunkStatus::Ok;
    }
    case ChunkSelectorKind::Label: break;
    }

    const Chunk* c = find_chunk_by_label(chunks, selector.label);
    if (!c) {
        return invalid(error, ChunkStatus::InvalidArguments, selector.label,
                       "no chunk with this label");
    }
    out->push_back(static_cast<size_t>(c - chunks.data()));
    return ChunkStatus::Ok;
}

}  // namespace datachunk
