#include "TileMatcher.h"
#include "RandomPicker.h"
#include "../Model.h"
#include <climits>

namespace Tessera {

TileMatcher::TileMatcher(const ICatalog& catalog, IRandomSource& random)
    : m_catalog(catalog), m_random(random) {}

int TileMatcher::Penalty(
    const ColorVector& desired,
    const ColorVector& candidate
) const {
    int total = 0;
    for (int i = 0; i < kSlotCount; ++i) {
        const int want = desired.IndexColor(i);
        const int have = candidate.IndexColor(i);
        if (want == kNoColor || want == have) {
            continue;
        }

        const int distance = m_catalog.Distance(want, have);
        if (distance < 0) {
            return kUnreachable;
        }
        total += distance;
    }
    return total;
}

std::optional<TileVariant> TileMatcher::FindBestMatch(
    const ColorVector& desired,
    const SlotMask& mask
) const {
    RandomPicker<TileVariant> matches;
    int lowestPenalty = INT_MAX;

    m_catalog.ForEachVariant([&](const TileVariant& variant) {
        if (!variant.colors.MatchesMasked(desired, mask)) {
            return;
        }

        const int penalty = Penalty(desired, variant.colors);
        if (penalty < 0 || penalty > lowestPenalty) {
            return;
        }

        if (penalty < lowestPenalty) {
            matches.Clear();
            lowestPenalty = penalty;
        }
        matches.Add(variant, m_catalog.Probability(variant));
    });

    if (matches.IsEmpty()) {
        return std::nullopt;
    }
    return matches.Pick(m_random);
}

} // namespace Tessera
