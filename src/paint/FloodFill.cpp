#include "FloodFill.h"
#include "../Neighbors.h"
#include <vector>

namespace Tessera {

static int DominantAt(const ITileMap& map, const ICatalog& catalog, int x, int y) {
    const TileRef tile = map.CellAt(x, y);
    if (tile.IsEmpty()) {
        return kNoColor;
    }
    const auto colors = catalog.ColorVectorOf(tile);
    return colors ? colors->DominantColor() : kNoColor;
}

FillRegion FindColorRegion(
    const ITileMap& map,
    const ICatalog& catalog,
    int startX,
    int startY,
    int limit
) {
    FillRegion result;
    result.color = DominantAt(map, catalog, startX, startY);
    if (result.color == kNoColor) {
        return result;
    }

    PositionSet visited;
    std::vector<Position> stack;
    stack.push_back({startX, startY});
    visited.insert({startX, startY});

    while (!stack.empty()) {
        const Position pos = stack.back();
        stack.pop_back();

        if (static_cast<int>(result.cells.size()) >= limit) {
            result.truncated = true;
            break;
        }
        result.cells.insert(pos);

        for (int dir : kCardinalDirections) {
            const Position nb = NeighborAt(pos, dir);
            if (visited.count(nb)) {
                continue;
            }
            visited.insert(nb);

            if (DominantAt(map, catalog, nb.first, nb.second) == result.color) {
                stack.push_back(nb);
            }
        }
    }

    return result;
}

} // namespace Tessera
