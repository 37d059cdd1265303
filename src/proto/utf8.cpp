#include <resplite/proto/utf8.hpp>
#include <cstdint>

namespace resplite {

    bool valid_utf8(std::string_view s) {
        std::size_t i = 0;
        const std::size_t n = s.size();
        while (i < n) {
            auto c = static_cast<std::uint8_t>(s[i]);
            if (c < 0x80) { ++i; continue; }

            std::size_t len = 0;
            std::uint8_t lo = 0x80, hi = 0xBF;  // allowed range of the second byte
            if (c >= 0xC2 && c <= 0xDF) { len = 2; }
            else if (c == 0xE0) { len = 3; lo = 0xA0; }
            else if (c == 0xED) { len = 3; hi = 0x9F; }  // no surrogates
            else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
            else if (c == 0xF0) { len = 4; lo = 0x90; }
            else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
            else if (c == 0xF4) { len = 4; hi = 0x8F; }  // <= U+10FFFF
            else return false;

            if (n - i < len) return false;
            auto c1 = static_cast<std::uint8_t>(s[i + 1]);
            if (c1 < lo || c1 > hi) return false;
            for (std::size_t k = 2; k < len; ++k) {
                auto ck = static_cast<std::uint8_t>(s[i + k]);
                if (ck < 0x80 || ck > 0xBF) return false;
            }
            i += len;
        }
        return true;
    }

} // namespace resplite
