#include "text_internal.h"

namespace datachunk::text_internal {

Utf8Step
utf8_step(std::span<const std::byte> bytes, size_t offset,
          uint32_t* out_len) noexcept
{
    const uint8_t lead = static_cast<uint8_t>(bytes[offset]);
    uint32_t len       = 0;
    uint8_t lo         = 0x80U;
    uint8_t hi         = 0xBFU;
    if (lead < 0x80U) {
        *out_len = 1;
        return Utf8Step::Valid;
    }
    if (lead >= 0xC2U && lead <= 0xDFU) {
        len = 2;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
        len = 3;
        // Reject overlongs (E0 80..9F) and surrogates (ED A0..BF).
        if (lead == 0xE0U) {
            lo = 0xA0U;
        } else if (lead == 0xEDU) {
            hi = 0x9FU;
        }
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
        len = 4;
        if (lead == 0xF0U) {
            lo = 0x90U;
        } else if (lead == 0xF4U) {
            hi = 0x8FU;
        }
    } else {
        *out_len = 1;
        return Utf8Step::Invalid;
    }

    for (uint32_t i = 1; i < len; ++i) {
        if (offset + i >= bytes.size()) {
            *out_len = static_cast<uint32_t>(bytes.size() - offset);
            return Utf8Step::Truncated;
        }
        const uint8_t c = static_cast<uint8_t>(bytes[offset + i]);
        const uint8_t min_c = (i == 1U) ? lo : 0x80U;
        const uint8_t max_c = (i == 1U) ? hi : 0xBFU;
        if (c < min_c || c > max_c) {
            *out_len = 1;
            return Utf8Step::Invalid;
        }
    }
    *out_len = len;
    return Utf8Step::Valid;
}


std::string_view
trim_blank(std::string_view s) noexcept
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_blank(s[b])) {
        b += 1;
    }
    while (e > b && (is_blank(s[e - 1]) || s[e - 1] == '\r')) {
        e -= 1;
    }
    return s.substr(b, e - b);
}


size_t
indent_width(std::string_view line) noexcept
{
    size_t n = 0;
    while (n < line.size() && is_blank(line[n])) {
        n += 1;
    }
    return n;
}


size_t
leading_backtick_run(std::string_view line) noexcept
{
    size_t i = indent_width(line);
    size_t n = 0;
    while (i + n < line.size() && line[i + n] == '`') {
        n += 1;
    }
    return n;
}


bool
is_name(std::string_view s) noexcept
{
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!is_name_char(c)) {
            return false;
        }
    }
    return true;
}


bool
parse_decimal_u64(std::string_view s, uint64_t* out) noexcept
{
    if (s.empty()) {
        return false;
    }
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10U) {
            return false;
        }
        v = v * 10U + d;
    }
    *out = v;
    return true;
}


std::span<const std::byte>
as_bytes(std::string_view s) noexcept
{
    return std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(s.data()), s.size());
}

}  // namespace datachunk::text_internal
