#include "datachunk/console_format.h"

#include "text_internal.h"

#include <cstdio>

namespace datachunk {

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool escaped   = false;
    const size_t n = (max_bytes == 0U || s.size() < max_bytes) ? s.size()
                                                               : max_bytes;
    const std::span<const std::byte> bytes = text_internal::as_bytes(
        s.substr(0, n));

    out->reserve(out->size() + n);
    size_t i = 0;
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        char buf[16];
        if (c >= 0x80U) {
            uint32_t len = 0;
            if (text_internal::utf8_step(bytes, i, &len)
                == text_internal::Utf8Step::Valid) {
                uint32_t cp = c & (0xFFU >> (len + 1U));
                for (uint32_t k = 1; k < len; ++k) {
                    cp = (cp << 6)
                         | (static_cast<unsigned char>(s[i + k]) & 0x3FU);
                }
                std::snprintf(buf, sizeof(buf), "\\u{%X}",
                              static_cast<unsigned>(cp));
                out->append(buf);
                escaped = true;
                i += len;
                continue;
            }
        }
        i += 1;
        if (c == '\\' || c == '"') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        }
        if (c == '\n' || c == '\r' || c == '\t') {
            out->push_back('\\');
            out->push_back(c == '\n' ? 'n' : (c == '\r' ? 'r' : 't'));
            escaped = true;
            continue;
        }
        if (c < 0x20U || c >= 0x7FU) {
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_line_range(const LineRange& range, std::string* out) noexcept
{
    char buf[48];
    const unsigned long long first = range.start + 1U;
    const unsigned long long last  = range.end > range.start ? range.end
                                                             : first;
    std::snprintf(buf, sizeof(buf), "%llu-%llu", first, last);
    out->append(buf);
}


void
append_byte_size(uint64_t bytes, std::string* out) noexcept
{
    static constexpr const char* kUnits[] = { "KiB", "MiB", "GiB", "TiB" };
    char buf[32];
    if (bytes < 1024U) {
        std::snprintf(buf, sizeof(buf), "%llu B",
                      static_cast<unsigned long long>(bytes));
        out->append(buf);
        return;
    }
    double v    = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (v >= 1024.0 && unit + 1U < sizeof(kUnits) / sizeof(kUnits[0])) {
        v /= 1024.0;
        unit += 1;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %s", v, kUnits[unit]);
    out->append(buf);
}

}  // namespace datachunk
