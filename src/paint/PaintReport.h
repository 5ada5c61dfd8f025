#pragma once

#include "../Model.h"
#include <vector>

namespace Tessera {

/**
 * What a paint operation did. Optional; pass nullptr to skip collection.
 */
struct PaintReport {
    std::vector<TileChange> changes;    // Cells whose tile actually changed
    std::vector<Position> unresolved;   // No eligible variant, cell untouched
    PaintColorMap paintColors;          // Painted + bridging colors used
    int intermediateCount = 0;          // Cells colored by ring expansion
    int affectedCount = 0;              // Cells visited by the resolver

    void Clear() {
        changes.clear();
        unresolved.clear();
        paintColors.clear();
        intermediateCount = 0;
        affectedCount = 0;
    }
};

} // namespace Tessera
