#pragma once

#include "datachunk/chunk_scan.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace datachunk {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes `\n`, `\r`, `\t`, `\\` and `"`
// - Writes valid UTF-8 sequences as `\u{X}`, other control/non-ASCII bytes
//   as `\xNN`
// - Truncates to `max_bytes` input bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends `range` as 1-based inclusive line numbers ("6-9").
void
append_line_range(const LineRange& range, std::string* out) noexcept;

// Appends a byte count with a binary unit ("512 B", "1.5 KiB").
void
append_byte_size(uint64_t bytes, std::string* out) noexcept;

}  // namespace datachunk
