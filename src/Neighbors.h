#pragma once

#include "ColorVector.h"
#include "Model.h"

namespace Tessera {

// ============================================================================
// 8-direction neighbor topology
// ============================================================================

struct Offset {
    int dx;
    int dy;
};

// Indexed by Direction, clockwise from Top
constexpr Offset kNeighborOffsets[kSlotCount] = {
    { 0, -1},  // Top
    { 1, -1},  // TopRight
    { 1,  0},  // Right
    { 1,  1},  // BottomRight
    { 0,  1},  // Bottom
    {-1,  1},  // BottomLeft
    {-1,  0},  // Left
    {-1, -1}   // TopLeft
};

// 4-connected subset (Top, Right, Bottom, Left)
constexpr int kCardinalDirections[4] = {Top, Right, Bottom, Left};

/**
 * Slot on the neighbor that faces back at us.
 * A cell's slot i and its neighbor's slot Opposite(i) describe the same
 * shared edge or corner.
 */
constexpr int Opposite(int direction) {
    return (direction + 4) % kSlotCount;
}

inline Position NeighborAt(const Position& pos, int direction) {
    const Offset& o = kNeighborOffsets[direction];
    return {pos.first + o.dx, pos.second + o.dy};
}

/**
 * Visit the 8-connected neighborhood of pos (pos itself excluded).
 */
template <typename Fn>
void ForEachNeighbor8(const Position& pos, Fn&& fn) {
    for (int i = 0; i < kSlotCount; ++i) {
        fn(NeighborAt(pos, i));
    }
}

} // namespace Tessera
