#include "safewhisper/utf8.hpp"

#include <cstddef>
#include <cstdint>

namespace safewhisper {

static bool isContinuation(uint8_t b) { return (b & 0xC0) == 0x80; }

bool isValidUtf8(std::string_view bytes) noexcept {
    const auto* s = reinterpret_cast<const uint8_t*>(bytes.data());
    const size_t n = bytes.size();
    size_t i = 0;

    while (i < n) {
        const uint8_t b0 = s[i];

        if (b0 < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t minCp = 0;

        if (b0 >= 0xC2 && b0 <= 0xDF) {
            len = 2; cp = b0 & 0x1F; minCp = 0x80;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3; cp = b0 & 0x0F; minCp = 0x800;
        } else if (b0 >= 0xF0 && b0 <= 0xF4) {
            len = 4; cp = b0 & 0x07; minCp = 0x10000;
        } else {
            return false;
        }

        if (n - i < len) return false;

        for (size_t k = 1; k < len; ++k) {
            if (!isContinuation(s[i + k])) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }

        if (cp < minCp || cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;

        i += len;
    }

    return true;
}

} // namespace safewhisper
