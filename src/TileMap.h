#pragma once

#include "Model.h"

namespace Tessera {

/**
 * Host-provided tile map.
 * The painter performs no bounds clamping; cells outside the host's storage
 * should read as empty and writes there are the host's call.
 */
class ITileMap {
public:
    virtual ~ITileMap() = default;

    // Empty TileRef when nothing is placed
    virtual TileRef CellAt(int x, int y) const = 0;

    virtual void SetCell(int x, int y, const TileRef& tile) = 0;

    // Informational only
    virtual int Width() const = 0;
    virtual int Height() const = 0;
};

} // namespace Tessera
