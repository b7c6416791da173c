#pragma once

#include "datachunk/binary_sniff.h"
#include "datachunk/chunk_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file payload_codec.h
 * \brief Encodes payload bytes into chunk body lines and decodes them back.
 */

namespace datachunk {

/// Declared content kind of a chunk payload (`format=` option).
enum class PayloadFormat : uint8_t {
    /// Pick from \ref is_binary.
    Auto,
    Text,
    Binary,
};

/// Body encoding of a chunk payload (`encoding=` option).
enum class PayloadEncoding : uint8_t {
    /// Pick from \ref is_binary: binary -> Base64, text -> Asis.
    Auto,
    Asis,
    Base64,
};

struct EncodeOptions final {
    /// Base64 characters per body line; multiple of 4 (0 = one line).
    uint32_t line_width = 76;
    /// Used when the encoding is \ref PayloadEncoding::Auto.
    SniffOptions sniff;
};

/// Option value spelling (`"text"`, `"binary"`); `"auto"` for Auto.
const char*
payload_format_name(PayloadFormat format) noexcept;

/// Option value spelling (`"asis"`, `"base64"`); `"auto"` for Auto.
const char*
payload_encoding_name(PayloadEncoding encoding) noexcept;

/// Parses `text`/`binary`. Returns false for anything else.
bool
parse_payload_format(std::string_view s, PayloadFormat* out) noexcept;

/// Parses `asis`/`base64`. Returns false for anything else.
bool
parse_payload_encoding(std::string_view s, PayloadEncoding* out) noexcept;

/// Returns true if \p bytes can be stored verbatim (valid UTF-8, no NUL).
bool
is_asis_text(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Encodes \p bytes into chunk body lines.
 *
 * - \ref PayloadEncoding::Asis: \p bytes must satisfy \ref is_asis_text,
 *   otherwise \ref ChunkStatus::InvalidEncodingChoice. CRLF and lone CR are
 *   normalized to LF and the text is split into lines; a final LF terminates
 *   the last line rather than adding an empty one.
 * - \ref PayloadEncoding::Base64: always succeeds; output is wrapped at
 *   \ref EncodeOptions::line_width characters.
 *
 * \p out_lines is replaced. A line width that is not a multiple of 4 is
 * rejected with \ref ChunkStatus::InvalidArguments.
 */
ChunkStatus
encode_payload(std::span<const std::byte> bytes, PayloadEncoding encoding,
               const EncodeOptions& options,
               std::vector<std::string>* out_lines, ChunkError* error) noexcept;

/**
 * \brief Decodes chunk body lines back into bytes.
 *
 * - \ref PayloadEncoding::Asis: every line followed by a single LF.
 * - \ref PayloadEncoding::Base64: lines are concatenated, ASCII whitespace is
 *   dropped and the result decoded; padding is required.
 *   \ref ChunkStatus::CorruptPayload on any violation.
 *
 * \p out is replaced. \ref PayloadEncoding::Auto is rejected with
 * \ref ChunkStatus::InvalidArguments.
 */
ChunkStatus
decode_payload(std::span<const std::string> lines, PayloadEncoding encoding,
               std::vector<std::byte>* out, ChunkError* error) noexcept;

/// Appends standard padded base64 of \p bytes to \p out (no line breaks).
void
append_base64(std::span<const std::byte> bytes, std::string* out) noexcept;

/**
 * \brief Decodes padded base64 \p text, ignoring ASCII whitespace.
 *
 * Appends to \p out. On failure returns false and sets \p out_bad_offset to
 * the offset of the first offending character (or `text.size()` when the
 * input ends inside a quartet).
 */
bool
decode_base64(std::string_view text, std::vector<std::byte>* out,
              size_t* out_bad_offset) noexcept;

}  // namespace datachunk
