#pragma once

#include "TileGrid.h"
#include "WangCatalog.h"
#include "Random.h"

#include <utility>
#include <vector>

namespace Tessera {
namespace Test {

/**
 * Add the 16 corner tiles for colors a and b, ids base .. base + 15.
 * Tile n has TL = bit 3, TR = bit 2, BR = bit 1, BL = bit 0 (0 = a, 1 = b),
 * so tile base is solid a and tile base + 15 is solid b.
 */
inline void AddCornerPair(WangCatalog& catalog, int base, int a, int b) {
    for (int n = 0; n < 16; ++n) {
        const int tl = (n & 8) ? b : a;
        const int tr = (n & 4) ? b : a;
        const int br = (n & 2) ? b : a;
        const int bl = (n & 1) ? b : a;
        catalog.AddVariant(
            ColorVector::FromArray({0, tr, 0, br, 0, bl, 0, tl}),
            TileRef(base + n)
        );
    }
}

enum ThreeColors { Grass = 1, Dirt = 2, Sand = 3 };

// Grass-Dirt tiles 0..15, Grass-Sand tiles 16..31, no Dirt-Sand tiles
inline WangCatalog ThreeColorCatalog() {
    WangCatalog catalog(CatalogType::Corner, "Ground");
    catalog.AddColor("Grass", Color::FromHex("#00ff00"));
    catalog.AddColor("Dirt", Color::FromHex("#8b4513"));
    catalog.AddColor("Sand", Color::FromHex("#f4e242"));
    AddCornerPair(catalog, 0, Grass, Dirt);
    AddCornerPair(catalog, 16, Grass, Sand);
    catalog.SetDistance(Grass, Dirt, 1);
    catalog.SetDistance(Grass, Sand, 1);
    catalog.SetDistance(Dirt, Sand, 2);
    return catalog;
}

// Grass-Dirt tiles 0..15 only
inline WangCatalog TwoColorCatalog() {
    WangCatalog catalog(CatalogType::Corner, "Ground");
    catalog.AddColor("Grass", Color::FromHex("#00ff00"));
    catalog.AddColor("Dirt", Color::FromHex("#8b4513"));
    AddCornerPair(catalog, 0, Grass, Dirt);
    catalog.SetDistance(Grass, Dirt, 1);
    return catalog;
}

enum WaterColors { Water = 3 };

// Grass-Dirt tiles 0..15 plus a lone solid Water tile 32
inline WangCatalog IslandCatalog() {
    WangCatalog catalog(CatalogType::Corner, "Island");
    catalog.AddColor("Grass", Color::FromHex("#00ff00"));
    catalog.AddColor("Dirt", Color::FromHex("#8b4513"));
    catalog.AddColor("Water", Color::FromHex("#2a5a9a"));
    AddCornerPair(catalog, 0, Grass, Dirt);
    catalog.AddVariant(ColorVector::AllCorners(Water), TileRef(32));
    catalog.SetDistance(Grass, Dirt, 1);
    return catalog;
}

// Chain 1 - 2 - 3 - 4, pairs at tiles 0, 16, 32
inline WangCatalog ChainCatalog() {
    WangCatalog catalog(CatalogType::Corner, "Chain");
    catalog.AddColor("A", Color::FromHex("#ff0000"));
    catalog.AddColor("B", Color::FromHex("#00ff00"));
    catalog.AddColor("C", Color::FromHex("#0000ff"));
    catalog.AddColor("D", Color::FromHex("#ffffff"));
    AddCornerPair(catalog, 0, 1, 2);
    AddCornerPair(catalog, 16, 2, 3);
    AddCornerPair(catalog, 32, 3, 4);
    for (int a = 1; a <= 4; ++a) {
        for (int b = 1; b <= 4; ++b) {
            catalog.SetDistance(a, b, a > b ? a - b : b - a);
        }
    }
    return catalog;
}

/**
 * Fork: 1-2, 2-4, 1-3, 3-5 (tiles 0, 16, 32, 48).
 * From 1, color 4 is reached through 2 and color 5 through 3.
 */
inline WangCatalog ForkCatalog() {
    WangCatalog catalog(CatalogType::Corner, "Fork");
    for (const char* name : {"A", "B", "C", "D", "E"}) {
        catalog.AddColor(name, Color());
    }
    AddCornerPair(catalog, 0, 1, 2);
    AddCornerPair(catalog, 16, 2, 4);
    AddCornerPair(catalog, 32, 1, 3);
    AddCornerPair(catalog, 48, 3, 5);

    catalog.SetDistance(1, 2, 1);
    catalog.SetDistance(1, 3, 1);
    catalog.SetDistance(1, 4, 2);
    catalog.SetDistance(1, 5, 2);
    catalog.SetDistance(2, 3, 2);
    catalog.SetDistance(2, 4, 1);
    catalog.SetDistance(2, 5, 3);
    catalog.SetDistance(3, 4, 3);
    catalog.SetDistance(3, 5, 1);
    catalog.SetDistance(4, 5, 4);
    return catalog;
}

/**
 * Add the 16 edge tiles for colors a and b, ids base .. base + 15.
 * Tile n has Top = bit 3, Right = bit 2, Bottom = bit 1, Left = bit 0.
 */
inline void AddEdgePair(WangCatalog& catalog, int base, int a, int b) {
    for (int n = 0; n < 16; ++n) {
        const int top = (n & 8) ? b : a;
        const int right = (n & 4) ? b : a;
        const int bottom = (n & 2) ? b : a;
        const int left = (n & 1) ? b : a;
        catalog.AddVariant(
            ColorVector::FromArray({top, 0, right, 0, bottom, 0, left, 0}),
            TileRef(base + n)
        );
    }
}

// Edge flavour of ThreeColorCatalog
inline WangCatalog ThreeColorEdgeCatalog() {
    WangCatalog catalog(CatalogType::Edge, "Paths");
    catalog.AddColor("Grass", Color::FromHex("#00ff00"));
    catalog.AddColor("Dirt", Color::FromHex("#8b4513"));
    catalog.AddColor("Sand", Color::FromHex("#f4e242"));
    AddEdgePair(catalog, 0, Grass, Dirt);
    AddEdgePair(catalog, 16, Grass, Sand);
    catalog.SetDistance(Grass, Dirt, 1);
    catalog.SetDistance(Grass, Sand, 1);
    catalog.SetDistance(Dirt, Sand, 2);
    return catalog;
}

// First variant whose corners are all color
inline TileRef SolidTile(const WangCatalog& catalog, int color) {
    for (const auto& variant : catalog.Variants()) {
        if (variant.colors == ColorVector::AllCorners(color)) {
            return variant.tile;
        }
    }
    return TileRef();
}

inline ColorVector ColorsAt(const WangCatalog& catalog, const TileGrid& grid,
                            int x, int y) {
    return catalog.ColorVectorOf(grid.CellAt(x, y)).value_or(ColorVector());
}

inline int Chebyshev(int x0, int y0, int x1, int y1) {
    const int dx = x0 > x1 ? x0 - x1 : x1 - x0;
    const int dy = y0 > y1 ? y0 - y1 : y1 - y0;
    return dx > dy ? dx : dy;
}

/**
 * Random source replaying fixed fractions of max, then repeating the last.
 */
class ScriptedRandom : public IRandomSource {
public:
    explicit ScriptedRandom(std::vector<double> fractions)
        : m_fractions(std::move(fractions)) {}

    double Uniform(double max) override {
        const double f = m_next < m_fractions.size()
            ? m_fractions[m_next]
            : m_fractions.back();
        ++m_next;
        ++calls;
        return f * max;
    }

    int calls = 0;

private:
    std::vector<double> m_fractions;
    std::size_t m_next = 0;
};

}  // namespace Test
}  // namespace Tessera
