#pragma once

#include "datachunk/chunk_scan.h"
#include "datachunk/chunk_settings.h"
#include "datachunk/chunk_status.h"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file chunk_decode.h
 * \brief Recovers the payload of a scanned data chunk.
 */

namespace datachunk {

struct DecodeOptions final {
    /// Compare against `md5sum` when the chunk carries one.
    bool verify_checksum = true;
};

struct DecodedChunk final {
    ChunkSettings settings;
    std::vector<std::byte> bytes;
    /// True when an `md5sum` option was present and matched.
    bool checksum_verified = false;
};

/**
 * \brief Resolves \p chunk's options and decodes its body into \p out.
 *
 * Errors carry the chunk label and its opening line number. A `format=text`
 * chunk whose decoded bytes are not UTF-8 text fails with
 * \ref ChunkStatus::InvalidEncodingChoice.
 */
ChunkStatus
decode_chunk_payload(const Chunk& chunk, const DecodeOptions& options,
                     DecodedChunk* out, ChunkError* error) noexcept;

/**
 * \brief Lines a host would echo for \p chunk.
 *
 * Empty unless `echo` is set. With `max.echo=N` (N > 0) and more than N body
 * lines, the first N lines followed by a `...` line.
 */
std::vector<std::string>
chunk_echo_lines(const Chunk& chunk, const ChunkSettings& settings);

/// First chunk in \p chunks labeled \p label, or null.
const Chunk*
find_chunk_by_label(std::span<const Chunk> chunks,
                    std::string_view label) noexcept;

}  // namespace datachunk
