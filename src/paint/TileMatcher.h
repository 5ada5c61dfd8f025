#pragma once

#include "../Catalog.h"
#include "../ColorVector.h"
#include "../Random.h"
#include <optional>

namespace Tessera {

/**
 * Picks the catalog variant that best fits a desired ColorVector.
 *
 * Masked slots are hard constraints. Every other nonzero desired slot that
 * the candidate disagrees with costs the color distance between the two
 * colors; a candidate needing an unreachable transition is rejected.
 * Among the cheapest candidates one is drawn weighted by the catalog's
 * probability.
 */
class TileMatcher {
public:
    TileMatcher(const ICatalog& catalog, IRandomSource& random);

    /**
     * @param desired Wanted colors per slot (0 = don't care)
     * @param mask Slots that must match exactly
     * @return Best variant, or nullopt if no candidate is eligible
     */
    std::optional<TileVariant> FindBestMatch(
        const ColorVector& desired,
        const SlotMask& mask
    ) const;

    /**
     * Soft cost of placing candidate where desired is wanted.
     * @return Sum of distances, or kUnreachable if any slot cannot bridge
     */
    int Penalty(const ColorVector& desired, const ColorVector& candidate) const;

private:
    const ICatalog& m_catalog;
    IRandomSource& m_random;
};

} // namespace Tessera
