#include "RegionResolver.h"
#include "../Log.h"
#include "../Neighbors.h"
#include <algorithm>
#include <cmath>

namespace Tessera {

RegionResolver::RegionResolver(
    const ICatalog& catalog,
    const TileMatcher& matcher
) : m_catalog(catalog), m_matcher(matcher) {}

std::vector<Position> RegionResolver::Order(
    const PositionSet& cells,
    const PaintColorMap& paintColors
) const {
    double cx = 0.0;
    double cy = 0.0;
    if (!paintColors.empty()) {
        for (const auto& entry : paintColors) {
            cx += entry.first.first;
            cy += entry.first.second;
        }
        cx /= static_cast<double>(paintColors.size());
        cy /= static_cast<double>(paintColors.size());
    }

    struct Keyed {
        int painted;   // 0 = has paint color
        double dist;
        Position pos;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(cells.size());
    for (const auto& pos : cells) {
        const int painted = paintColors.count(pos) ? 0 : 1;
        const double dist = std::fabs(pos.first - cx) + std::fabs(pos.second - cy);
        keyed.push_back({painted, dist, pos});
    }

    // (y, x) breaks the remaining ties so hash order never leaks into results
    std::sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
        if (a.painted != b.painted) return a.painted < b.painted;
        if (a.dist != b.dist) return a.dist < b.dist;
        if (a.pos.second != b.pos.second) return a.pos.second < b.pos.second;
        return a.pos.first < b.pos.first;
    });

    std::vector<Position> ordered;
    ordered.reserve(keyed.size());
    for (const auto& k : keyed) {
        ordered.push_back(k.pos);
    }
    return ordered;
}

ColorVector RegionResolver::DesiredFromSurroundings(
    const ITileMap& map,
    const Position& pos
) const {
    ColorVector desired;
    for (int i = 0; i < kSlotCount; ++i) {
        const Position nb = NeighborAt(pos, i);
        const TileRef tile = map.CellAt(nb.first, nb.second);
        if (tile.IsEmpty()) {
            continue;
        }

        const auto colors = m_catalog.ColorVectorOf(tile);
        if (!colors) {
            continue;
        }
        desired.SetIndexColor(i, colors->IndexColor(Opposite(i)));
    }
    return desired;
}

ColorVector RegionResolver::ApplyPaintColor(
    const ColorVector& desired,
    int color
) const {
    ColorVector result = desired;
    for (int slot : ActiveSlots(m_catalog.Type())) {
        result.SetIndexColor(slot, color);
    }
    return result;
}

void RegionResolver::Resolve(
    ITileMap& map,
    const PositionSet& cells,
    const PaintColorMap& paintColors,
    PaintReport* report
) const {
    const std::vector<Position> ordered = Order(cells, paintColors);
    int placed = 0;

    for (const auto& pos : ordered) {
        ColorVector desired = DesiredFromSurroundings(map, pos);

        auto paint = paintColors.find(pos);
        if (paint != paintColors.end()) {
            desired = ApplyPaintColor(desired, paint->second);
        }

        const auto match = m_matcher.FindBestMatch(desired, desired.Mask());
        if (!match) {
            SDL_LogDebug(TESSERA_LOG_CATEGORY,
                "No tile fits (%d, %d), wanted %s",
                pos.first, pos.second, desired.ToString().c_str());
            if (report) {
                report->unresolved.push_back(pos);
            }
            continue;
        }

        const TileRef previous = map.CellAt(pos.first, pos.second);
        map.SetCell(pos.first, pos.second, match->tile);
        ++placed;

        // Read back: hosts may drop writes outside their storage
        const TileRef current = map.CellAt(pos.first, pos.second);
        if (report && previous != current) {
            report->changes.push_back({pos.first, pos.second, previous, current});
        }
    }

    if (report) {
        report->affectedCount += static_cast<int>(ordered.size());
    }

    SDL_LogDebug(TESSERA_LOG_CATEGORY,
        "Resolved %d of %d cells (%d painted)",
        placed, static_cast<int>(ordered.size()),
        static_cast<int>(paintColors.size()));
}

} // namespace Tessera
