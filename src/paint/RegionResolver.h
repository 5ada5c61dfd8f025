#pragma once

#include "../Catalog.h"
#include "../Model.h"
#include "../TileMap.h"
#include "PaintReport.h"
#include "TileMatcher.h"
#include <vector>

namespace Tessera {

/**
 * Re-resolves the tiles of a set of cells, inside-out.
 *
 * Painted cells go first, then the rest, each group ordered by Manhattan
 * distance to the centroid of the painted cells. Every cell builds its
 * desired colors from the neighbors placed so far, applies its paint color
 * if it has one, and takes the best match. Cells without a match keep
 * their current tile.
 */
class RegionResolver {
public:
    RegionResolver(const ICatalog& catalog, const TileMatcher& matcher);

    void Resolve(
        ITileMap& map,
        const PositionSet& cells,
        const PaintColorMap& paintColors,
        PaintReport* report = nullptr
    ) const;

    /**
     * Resolution order used by Resolve(). Exposed for tests and previews.
     */
    std::vector<Position> Order(
        const PositionSet& cells,
        const PaintColorMap& paintColors
    ) const;

    /**
     * Desired colors of pos as implied by the tiles around it.
     * Slot i copies the neighbor's slot Opposite(i).
     */
    ColorVector DesiredFromSurroundings(
        const ITileMap& map,
        const Position& pos
    ) const;

    // Overwrite the catalog's active slots with color
    ColorVector ApplyPaintColor(const ColorVector& desired, int color) const;

private:
    const ICatalog& m_catalog;
    const TileMatcher& m_matcher;
};

} // namespace Tessera
