#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file chunk_status.h
 * \brief Status codes and error context shared by all datachunk operations.
 */

namespace datachunk {

/// Result status of a datachunk operation.
enum class ChunkStatus : uint8_t {
    Ok,
    /// Requested text handling but the payload is not text (or vice versa).
    InvalidEncodingChoice,
    /// The encoded body could not be decoded (e.g. invalid base64).
    CorruptPayload,
    /// Decoded bytes do not match the stored digest.
    ChecksumMismatch,
    /// Header syntax error, duplicate option or nested fence.
    MalformedHeader,
    /// The document ended while a chunk was still open.
    UnterminatedChunk,
    /// Incoherent parameter combination supplied by the caller.
    InvalidArguments,
    /// Splice position or range outside the document.
    InvalidPosition,
};

/**
 * \brief Context for a failed operation.
 *
 * Filled by operations that accept a `ChunkError*`; all fields are optional
 * and empty/zero when not applicable.
 */
struct ChunkError final {
    ChunkStatus status = ChunkStatus::Ok;
    /// 1-based document line number (0 = unknown).
    uint64_t line = 0;
    /// Label of the chunk being processed, if known.
    std::string label;
    /// Offending header fragment or option key.
    std::string fragment;
    std::string expected_digest;
    std::string actual_digest;
    std::string message;
};

/// Returns a stable snake_case name for \p status.
const char*
chunk_status_name(ChunkStatus status) noexcept;

/// Resets \p error to the Ok state (no-op when \p error is null).
void
clear_chunk_error(ChunkError* error) noexcept;

/**
 * \brief Records \p status and \p message into \p error and returns \p status.
 *
 * Keeps any line/label context already present in \p error so callers higher
 * up can add context without losing the original message.
 */
ChunkStatus
set_chunk_error(ChunkError* error, ChunkStatus status,
                std::string_view message) noexcept;

/**
 * \brief Formats \p error as a single diagnostic line.
 *
 * Output format: `<status>: [line N: ][chunk 'label': ]message[ (fragment)]`
 * followed by ` expected=<hex> actual=<hex>` for checksum failures.
 */
std::string
format_chunk_error(const ChunkError& error);

}  // namespace datachunk
