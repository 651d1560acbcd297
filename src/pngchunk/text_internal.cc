#include "text_internal.h"

#include <cstdint>

namespace pngchunk::text_internal {

bool
is_valid_utf8(std::span<const std::byte> bytes) noexcept
{
    size_t i = 0U;
    while (i < bytes.size()) {
        const uint8_t b0 = static_cast<uint8_t>(bytes[i]);
        size_t len       = 0U;
        if (b0 <= 0x7FU) {
            i += 1U;
            continue;
        }
        if (b0 >= 0xC2U && b0 <= 0xDFU) {
            len = 2U;
        } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
            len = 3U;
        } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
            len = 4U;
        } else {
            return false;
        }

        if (len > bytes.size() - i) {
            return false;
        }

        const uint8_t b1 = static_cast<uint8_t>(bytes[i + 1U]);
        if ((b0 == 0xE0U && b1 < 0xA0U) || (b0 == 0xEDU && b1 >= 0xA0U)
            || (b0 == 0xF0U && b1 < 0x90U) || (b0 == 0xF4U && b1 >= 0x90U)) {
            return false;
        }
        for (size_t j = 1U; j < len; ++j) {
            const uint8_t bj = static_cast<uint8_t>(bytes[i + j]);
            if ((bj & 0xC0U) != 0x80U) {
                return false;
            }
        }
        i += len;
    }
    return true;
}


bool
is_ascii_letter(std::byte b) noexcept
{
    const uint8_t c = static_cast<uint8_t>(b);
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

}  // namespace pngchunk::text_internal
