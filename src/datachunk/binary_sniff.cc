#include "datachunk/binary_sniff.h"

#include "text_internal.h"

namespace datachunk {
namespace {

    static bool is_text_control(uint8_t c) noexcept
    {
        // \b \t \n \v \f \r and ESC (ANSI sequences in logs).
        return (c >= 0x08U && c <= 0x0DU) || c == 0x1BU;
    }

}  // namespace

bool
is_binary(std::span<const std::byte> bytes,
          const SniffOptions& options) noexcept
{
    size_t n = bytes.size();
    if (options.sample_bytes != 0U && n > options.sample_bytes) {
        n = options.sample_bytes;
    }
    if (n == 0U) {
        return false;
    }
    const std::span<const std::byte> sample = bytes.first(n);

    uint64_t nontext = 0;
    size_t i         = 0;
    while (i < n) {
        const uint8_t c = static_cast<uint8_t>(sample[i]);
        if (c == 0x00U) {
            return true;
        }
        if (c < 0x80U) {
            if ((c < 0x20U && !is_text_control(c)) || c == 0x7FU) {
                nontext += 1;
            }
            i += 1;
            continue;
        }

        uint32_t len = 0;
        const text_internal::Utf8Step step
            = text_internal::utf8_step(sample, i, &len);
        if (step == text_internal::Utf8Step::Invalid) {
            nontext += 1;
        }
        i += len;
    }

    return nontext * 100U
           > static_cast<uint64_t>(n) * options.max_nontext_percent;
}

}  // namespace datachunk
