#include "datachunk/chunk_decode.h"

#include "datachunk/payload_codec.h"
#include "datachunk/payload_digest.h"

namespace datachunk {
namespace {

    static ChunkStatus with_context(const Chunk& chunk, ChunkStatus status,
                                    ChunkError* error) noexcept
    {
        if (error) {
            error->label = chunk.label;
            if (error->line == 0) {
                error->line = chunk.range.start + 1U;
            }
        }
        return status;
    }

}  // namespace

ChunkStatus
decode_chunk_payload(const Chunk& chunk, const DecodeOptions& options,
                     DecodedChunk* out, ChunkError* error) noexcept
{
    clear_chunk_error(error);
    if (!out) {
        return set_chunk_error(error, ChunkStatus::InvalidArguments,
                               "null output");
    }
    *out = DecodedChunk {};

    ChunkStatus st = resolve_chunk_settings(chunk.options, &out->settings,
                                            error);
    if (st != ChunkStatus::Ok) {
        return with_context(chunk, st, error);
    }

    st = decode_payload(chunk.body_lines, out->settings.encoding, &out->bytes,
                        error);
    if (st != ChunkStatus::Ok) {
        return with_context(chunk, st, error);
    }

    if (out->settings.format == PayloadFormat::Text
        && !is_asis_text(out->bytes)) {
        out->bytes.clear();
        set_chunk_error(error, ChunkStatus::InvalidEncodingChoice,
                        "format=\"text\" but payload is not UTF-8 text");
        return with_context(chunk, ChunkStatus::InvalidEncodingChoice, error);
    }

    if (options.verify_checksum && !out->settings.md5sum.empty()) {
        st = verify_payload_digest(out->bytes, out->settings.md5sum, error);
        if (st != ChunkStatus::Ok) {
            out->bytes.clear();
            return with_context(chunk, st, error);
        }
        out->checksum_verified = true;
    }
    return ChunkStatus::Ok;
}


std::vector<std::string>
chunk_echo_lines(const Chunk& chunk, const ChunkSettings& settings)
{
    std::vector<std::string> lines;
    if (!settings.echo) {
        return lines;
    }
    const size_t n = chunk.body_lines.size();
    if (settings.max_echo == 0 || n <= settings.max_echo) {
        lines = chunk.body_lines;
        return lines;
    }
    lines.assign(chunk.body_lines.begin(),
                 chunk.body_lines.begin() + settings.max_echo);
    lines.emplace_back("...");
    return lines;
}


const Chunk*
find_chunk_by_label(std::span<const Chunk> chunks,
                    std::string_view label) noexcept
{
    for (const Chunk& c : chunks) {
        if (c.label == label) {
            return &c;
        }
    }
    return nullptr;
}

}  // namespace datachunk
