#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace datachunk::text_internal {

enum class Utf8Step : uint8_t {
    Valid,
    Invalid,
    /// Sequence is well-formed so far but runs past the end of the input.
    Truncated,
};

/// Classifies the UTF-8 sequence starting at \p bytes[offset].
Utf8Step
utf8_step(std::span<const std::byte> bytes, size_t offset,
          uint32_t* out_len) noexcept;

constexpr bool
is_blank(char c) noexcept
{
    return c == ' ' || c == '\t';
}

std::string_view
trim_blank(std::string_view s) noexcept;

/// Leading spaces/tabs count of \p line.
size_t
indent_width(std::string_view line) noexcept;

/// Length of the backtick run that starts after the indentation of \p line.
size_t
leading_backtick_run(std::string_view line) noexcept;

/// True for `[A-Za-z0-9._-]` (engine names, labels, option keys).
constexpr bool
is_name_char(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
           || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

bool
is_name(std::string_view s) noexcept;

/// Unsigned decimal digits only (no sign, no blanks); false on overflow.
bool
parse_decimal_u64(std::string_view s, uint64_t* out) noexcept;

std::span<const std::byte>
as_bytes(std::string_view s) noexcept;

}  // namespace datachunk::text_internal
