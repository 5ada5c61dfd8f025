#include "RingExpander.h"
#include "../Log.h"
#include "../Neighbors.h"
#include <climits>

namespace Tessera {

RingExpander::RingExpander(const ICatalog& catalog, RingPolicy policy)
    : m_catalog(catalog), m_policy(policy) {}

int RingExpander::DominantColorAt(
    const ITileMap& map,
    const Position& pos
) const {
    const TileRef tile = map.CellAt(pos.first, pos.second);
    if (tile.IsEmpty()) {
        return kNoColor;
    }

    const auto colors = m_catalog.ColorVectorOf(tile);
    if (!colors) {
        return kNoColor;
    }
    return colors->DominantColor();
}

int RingExpander::NextColorOnPath(int from, int to) const {
    if (m_catalog.Distance(from, to) <= 1) {
        return kNoColor;
    }

    int bestNext = kNoColor;
    int bestRemaining = INT_MAX;

    for (int c = 1; c <= m_catalog.ColorCount(); ++c) {
        if (c == from) continue;
        if (m_catalog.Distance(from, c) != 1) continue;

        const int remaining = m_catalog.Distance(c, to);
        if (remaining >= 0 && remaining < bestRemaining) {
            bestNext = c;
            bestRemaining = remaining;
        }
    }
    return bestNext;
}

int RingExpander::ChooseFromColor(
    const std::set<int>& candidates,
    int dominant
) const {
    // Farthest source wins; unreachable (-1) ranks below every real distance
    int chosen = *candidates.begin();
    int chosenDistance = m_catalog.Distance(chosen, dominant);
    for (int c : candidates) {
        const int d = m_catalog.Distance(c, dominant);
        if (d > chosenDistance) {
            chosen = c;
            chosenDistance = d;
        }
    }
    return chosen;
}

PaintColorMap RingExpander::ComputeRings(
    const ITileMap& map,
    const PositionSet& positions,
    int color
) const {
    PaintColorMap intermediates;
    PositionSet visited(positions.begin(), positions.end());

    Frontier frontier;
    for (const auto& pos : positions) {
        ForEachNeighbor8(pos, [&](const Position& nb) {
            if (!visited.count(nb)) {
                frontier[nb].insert(color);
            }
        });
    }

    int ringColor = color;  // SingleColor policy only
    int ring = 0;

    while (!frontier.empty()) {
        Frontier next;
        std::set<int> insertedThisRing;

        for (const auto& [pos, sources] : frontier) {
            // Reached from this ring as well as the previous one
            if (visited.count(pos)) {
                continue;
            }
            visited.insert(pos);

            const int dominant = DominantColorAt(map, pos);
            if (dominant == kNoColor) {
                continue;
            }

            const int from = m_policy == RingPolicy::PerBranch
                ? ChooseFromColor(sources, dominant)
                : ringColor;
            if (dominant == from) {
                continue;
            }

            const int distance = m_catalog.Distance(from, dominant);
            if (distance < 0) {
                SDL_LogDebug(TESSERA_LOG_CATEGORY,
                    "No transition path %d -> %d at (%d, %d)",
                    from, dominant, pos.first, pos.second);
                continue;
            }
            if (distance <= 1) {
                continue;
            }

            const int hop = NextColorOnPath(from, dominant);
            if (hop == kNoColor) {
                continue;
            }

            intermediates[pos] = hop;
            insertedThisRing.insert(hop);

            ForEachNeighbor8(pos, [&](const Position& nb) {
                if (!visited.count(nb)) {
                    next[nb].insert(hop);
                }
            });
        }

        if (!insertedThisRing.empty()) {
            SDL_LogDebug(TESSERA_LOG_CATEGORY,
                "Ring %d: %d bridge colors, total %d cells",
                ring, static_cast<int>(insertedThisRing.size()),
                static_cast<int>(intermediates.size()));
            ringColor = *insertedThisRing.begin();
        }

        frontier.swap(next);
        ++ring;
    }

    return intermediates;
}

} // namespace Tessera
