#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file binary_sniff.h
 * \brief Heuristic text/binary classification of a byte buffer.
 */

namespace datachunk {

/// Sampling budget for \ref is_binary.
struct SniffOptions final {
    /// Only the first `sample_bytes` bytes are examined (0 = whole buffer).
    uint32_t sample_bytes = 4096;
    /// Buffer is binary when more than this share (in percent) is non-text.
    uint32_t max_nontext_percent = 30;
};

/**
 * \brief Returns true when \p bytes look like binary data.
 *
 * A NUL byte within the sample makes the buffer binary. Otherwise bytes that
 * are neither printable ASCII, common whitespace, nor part of a valid UTF-8
 * sequence are counted as non-text and compared against
 * \ref SniffOptions::max_nontext_percent. An empty buffer is text.
 */
bool
is_binary(std::span<const std::byte> bytes,
          const SniffOptions& options = SniffOptions {}) noexcept;

}  // namespace datachunk
