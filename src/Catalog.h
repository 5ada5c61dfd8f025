#pragma once

#include "ColorVector.h"
#include "Model.h"
#include <functional>
#include <optional>

namespace Tessera {

/**
 * Host-provided tile catalog (a Wang set).
 * Read-only from the painter's point of view; building and validating it
 * is the host's job.
 */
class ICatalog {
public:
    virtual ~ICatalog() = default;

    /**
     * Enumerate every placeable variant, including the pre-computed rotated
     * and reflected duplicates. Enumeration order must be stable.
     */
    virtual void ForEachVariant(
        const std::function<void(const TileVariant&)>& fn
    ) const = 0;

    /**
     * Colors of a placed tile.
     * @return nullopt when the tile does not belong to this catalog
     */
    virtual std::optional<ColorVector> ColorVectorOf(const TileRef& tile) const = 0;

    /**
     * Color-adjacency distance. Symmetric, Distance(a, a) == 0.
     * @return kUnreachable when no chain of transition tiles exists
     */
    virtual int Distance(int colorA, int colorB) const = 0;

    // Number of colors; valid colors are [1, ColorCount()]
    virtual int ColorCount() const = 0;

    // Non-negative selection weight for tie-breaking
    virtual float Probability(const TileVariant& variant) const = 0;

    virtual CatalogType Type() const = 0;
};

} // namespace Tessera
