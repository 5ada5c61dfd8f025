#pragma once

#include "../Catalog.h"
#include "../Model.h"
#include "../TileMap.h"

namespace Tessera {

struct FillRegion {
    PositionSet cells;
    int color = kNoColor;   // Dominant color shared by every cell
    bool truncated = false; // Hit the cell limit before closing
};

/**
 * 4-connected flood fill over cells whose tiles share the start cell's
 * dominant color. Empty or foreign cells bound the region.
 * @param limit Maximum number of cells to collect
 */
FillRegion FindColorRegion(
    const ITileMap& map,
    const ICatalog& catalog,
    int startX,
    int startY,
    int limit
);

} // namespace Tessera
