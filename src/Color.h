#pragma once

#include <cstdint>
#include <string>

namespace Tessera {

/**
 * 8-bit RGBA swatch attached to a terrain color.
 * Catalog files store it as "#rrggbb" or "#rrggbbaa"; painting never reads it.
 */
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : r(r), g(g), b(b), a(a) {}

    // Opaque black when hex is malformed
    static Color FromHex(const std::string& hex);
    std::string ToHex(bool includeAlpha = true) const;

    // Packed 0xAABBGGRR
    uint32_t ToU32() const {
        return (uint32_t(a) << 24) | (uint32_t(b) << 16) | (uint32_t(g) << 8) | r;
    }

    bool operator==(const Color& other) const { return ToU32() == other.ToU32(); }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

} // namespace Tessera
