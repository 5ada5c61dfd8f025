#include "Color.h"
#include <cctype>
#include <cstdio>

namespace Tessera {

static int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

Color Color::FromHex(const std::string& hex) {
    if ((hex.size() != 7 && hex.size() != 9) || hex[0] != '#') {
        return Color();
    }

    uint8_t channels[4] = {0, 0, 0, 255};
    const std::size_t count = (hex.size() - 1) / 2;
    for (std::size_t i = 0; i < count; ++i) {
        const int hi = HexDigit(hex[1 + i * 2]);
        const int lo = HexDigit(hex[2 + i * 2]);
        if (hi < 0 || lo < 0) {
            return Color();
        }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color(channels[0], channels[1], channels[2], channels[3]);
}

std::string Color::ToHex(bool includeAlpha) const {
    char buf[10];
    if (includeAlpha) {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", r, g, b, a);
    } else {
        snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    }
    return buf;
}

} // namespace Tessera
