#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "ColorVector.h"

namespace Tessera {

// ============================================================================
// Positions
// ============================================================================

// Hash function for std::pair<int, int> (for cell coordinates)
struct PairHash {
    std::size_t operator()(const std::pair<int, int>& p) const {
        return std::hash<int>()(p.first) ^ (std::hash<int>()(p.second) << 1);
    }
};

// Cell coordinate (x, y); y grows downward
using Position = std::pair<int, int>;
using PositionSet = std::unordered_set<Position, PairHash>;

// Desired terrain color per cell for one paint operation
using PaintColorMap = std::unordered_map<Position, int, PairHash>;

// ============================================================================
// Colors
// ============================================================================

// Color index 0 is "empty / unconstrained"; real colors start at 1
constexpr int kNoColor = 0;

// Distance sentinel when no chain of transition tiles links two colors
constexpr int kUnreachable = -1;

// ============================================================================
// Tiles
// ============================================================================

/**
 * Reference to a placeable tile, as stored in a map cell.
 * Rotated and reflected variants share a tile id and differ in flip flags.
 */
struct TileRef {
    int tileId = -1;     // -1 = empty cell
    bool flipH = false;
    bool flipV = false;
    bool flipD = false;  // Anti-diagonal flip (rotation building block)

    TileRef() = default;
    explicit TileRef(int id, bool h = false, bool v = false, bool d = false)
        : tileId(id), flipH(h), flipV(v), flipD(d) {}

    bool IsEmpty() const { return tileId < 0; }

    bool operator==(const TileRef& other) const {
        return tileId == other.tileId && flipH == other.flipH &&
               flipV == other.flipV && flipD == other.flipD;
    }
    bool operator!=(const TileRef& other) const { return !(*this == other); }
};

// Hash function for TileRef (flip flags folded into the low bits)
struct TileRefHash {
    std::size_t operator()(const TileRef& t) const {
        const int flags = (t.flipH ? 1 : 0) | (t.flipV ? 2 : 0) | (t.flipD ? 4 : 0);
        return std::hash<int>()(t.tileId) ^ (std::hash<int>()(flags) << 1);
    }
};

/**
 * One placeable orientation of a tile together with its colors.
 * Owned by the catalog; probability is the per-tile weight and is combined
 * with color weights by the catalog.
 */
struct TileVariant {
    ColorVector colors;
    TileRef tile;
    float probability = 1.0f;
};

// ============================================================================
// Change records
// ============================================================================

/**
 * A single cell write performed by a paint operation.
 * Hosts can replay these backwards to undo.
 */
struct TileChange {
    int x;
    int y;
    TileRef oldTile;
    TileRef newTile;
};

} // namespace Tessera
