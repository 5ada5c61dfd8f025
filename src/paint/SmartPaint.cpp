#include "SmartPaint.h"
#include "FloodFill.h"
#include "RegionResolver.h"
#include "TileMatcher.h"
#include "../Log.h"
#include "../Neighbors.h"

namespace Tessera {

void SmartPaint(
    ITileMap& map,
    const ICatalog& catalog,
    const PositionSet& positions,
    int color,
    IRandomSource& random,
    const PaintOptions& options,
    PaintReport* report
) {
    PaintColorMap paintColors;
    for (const auto& pos : positions) {
        paintColors[pos] = color;
    }

    RingExpander expander(catalog, options.ringPolicy);
    const PaintColorMap rings = expander.ComputeRings(map, positions, color);

    int inserted = 0;
    for (const auto& [pos, ringColor] : rings) {
        if (paintColors.emplace(pos, ringColor).second) {
            ++inserted;
        }
    }

    PositionSet affected;
    for (const auto& entry : paintColors) {
        affected.insert(entry.first);
        ForEachNeighbor8(entry.first, [&](const Position& nb) {
            affected.insert(nb);
        });
    }

    SDL_LogDebug(TESSERA_LOG_CATEGORY,
        "Paint color %d: %d cells, %d bridging, %d affected",
        color, static_cast<int>(positions.size()), inserted,
        static_cast<int>(affected.size()));

    TileMatcher matcher(catalog, random);
    RegionResolver resolver(catalog, matcher);
    resolver.Resolve(map, affected, paintColors, report);

    if (report) {
        report->intermediateCount += inserted;
        for (const auto& entry : paintColors) {
            report->paintColors[entry.first] = entry.second;
        }
    }
}

// ============================================================================
// SmartPainter implementation
// ============================================================================

SmartPainter::SmartPainter(
    const ICatalog& catalog,
    IRandomSource& random,
    const PaintOptions& options
) : m_catalog(catalog), m_random(random), m_options(options) {
    // Leave the host's log priority alone unless asked for debug output
    if (m_options.verboseLog) {
        Log::SetVerbose(true);
    }
}

void SmartPainter::Paint(
    ITileMap& map,
    const PositionSet& positions,
    int color,
    PaintReport* report
) const {
    if (positions.empty()) {
        return;
    }
    SmartPaint(map, m_catalog, positions, color, m_random, m_options, report);
}

void SmartPainter::PaintAt(
    ITileMap& map,
    int x,
    int y,
    int color,
    PaintReport* report
) const {
    PositionSet cells;
    cells.insert({x, y});
    Paint(map, cells, color, report);
}

bool SmartPainter::Fill(
    ITileMap& map,
    int x,
    int y,
    int color,
    PaintReport* report
) const {
    FillRegion region = FindColorRegion(map, m_catalog, x, y, m_options.fillLimit);
    if (region.truncated) {
        SDL_LogWarn(TESSERA_LOG_CATEGORY,
            "Fill at (%d, %d) exceeds %d cells, skipped",
            x, y, m_options.fillLimit);
        return false;
    }
    if (region.cells.empty() || region.color == color) {
        return false;
    }

    SmartPaint(map, m_catalog, region.cells, color, m_random, m_options, report);
    return true;
}

} // namespace Tessera
