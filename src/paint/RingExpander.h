#pragma once

#include "../Catalog.h"
#include "../Model.h"
#include "../TileMap.h"
#include <map>
#include <set>

namespace Tessera {

/**
 * How a ring decides which color it bridges from.
 */
enum class RingPolicy {
    // Every frontier cell bridges from the colors of the cells that reached it
    PerBranch,
    // One color per ring: the lowest color index inserted by the previous ring
    SingleColor
};

/**
 * Breadth-first search outward from a painted area that inserts
 * intermediate colors wherever the painted color (or the previous ring's
 * bridge) cannot transition directly into the existing terrain.
 *
 * With Grass-Dirt and Grass-Sand tiles but no Dirt-Sand tiles, painting
 * Sand into Dirt yields one ring of Grass around the Sand.
 */
class RingExpander {
public:
    explicit RingExpander(
        const ICatalog& catalog,
        RingPolicy policy = RingPolicy::PerBranch
    );

    /**
     * @param map Map whose current tiles define the existing terrain
     * @param positions Cells being painted
     * @param color Painted color
     * @return Bridging color per cell (painted cells never appear)
     */
    PaintColorMap ComputeRings(
        const ITileMap& map,
        const PositionSet& positions,
        int color
    ) const;

    /**
     * Most frequent color of the tile at pos, 0 when empty or foreign.
     */
    int DominantColorAt(const ITileMap& map, const Position& pos) const;

    /**
     * First color on a shortest path from -> to.
     * @return 0 when the colors are already adjacent or no hop exists
     */
    int NextColorOnPath(int from, int to) const;

    RingPolicy Policy() const { return m_policy; }

private:
    // Frontier cell -> colors of the cells that reached it
    using Frontier = std::map<Position, std::set<int>>;

    int ChooseFromColor(const std::set<int>& candidates, int dominant) const;

    const ICatalog& m_catalog;
    RingPolicy m_policy;
};

} // namespace Tessera
