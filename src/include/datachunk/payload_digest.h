#pragma once

#include "datachunk/chunk_status.h"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

/**
 * \file payload_digest.h
 * \brief MD5 integrity digest over the original (pre-encoding) payload bytes.
 *
 * The digest detects accidental corruption of embedded data; it is not a
 * security control.
 */

namespace datachunk {

/// Hex characters in a digest string.
inline constexpr size_t kPayloadDigestHexSize = 32;

/**
 * \brief Computes the lowercase hex MD5 digest of \p bytes into \p out_hex.
 *
 * Returns false (and clears \p out_hex) only if the digest backend fails.
 */
bool
payload_digest_hex(std::span<const std::byte> bytes,
                   std::string* out_hex) noexcept;

/**
 * \brief Verifies \p bytes against \p expected_hex (case-insensitive).
 *
 * Returns \ref ChunkStatus::ChecksumMismatch with both digests recorded in
 * \p error when they differ (including a malformed \p expected_hex).
 */
ChunkStatus
verify_payload_digest(std::span<const std::byte> bytes,
                      std::string_view expected_hex, ChunkError* error) noexcept;

/// Runtime version string of the digest backend (OpenSSL).
std::string_view
digest_backend_version() noexcept;

}  // namespace datachunk
