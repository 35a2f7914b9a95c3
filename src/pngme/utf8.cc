//
// UTF-8 validation for text payloads.
//

#include "utf8.hh"

#include <cstdint>

namespace pngme {
    namespace {
        bool is_continuation(std::uint8_t b) {
            return (b & 0xC0) == 0x80;
        }
    }

    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto lead = static_cast<std::uint8_t>(data[i]);
            if (lead < 0x80) {
                i++;
                continue;
            }

            std::size_t len;
            // Bounds of the first continuation byte, tightened to reject
            // overlong forms, surrogates and code points above U+10FFFF
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                len = 2;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                len = 3;
                if (lead == 0xE0) {
                    lo = 0xA0;
                } else if (lead == 0xED) {
                    hi = 0x9F;
                }
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                len = 4;
                if (lead == 0xF0) {
                    lo = 0x90;
                } else if (lead == 0xF4) {
                    hi = 0x8F;
                }
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }
            auto first = static_cast<std::uint8_t>(data[i + 1]);
            if (first < lo || first > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; k++) {
                if (!is_continuation(static_cast<std::uint8_t>(data[i + k]))) {
                    return i;
                }
            }
            i += len;
        }
        return std::nullopt;
    }
}
