#pragma once

#include "../Catalog.h"
#include "../Model.h"
#include "../Random.h"
#include "../TileMap.h"
#include "PaintReport.h"
#include "RingExpander.h"
#include <cstdint>

namespace Tessera {

/**
 * Painter settings. Loaded from JSON by IOJson::LoadOptionsFromString.
 */
struct PaintOptions {
    RingPolicy ringPolicy = RingPolicy::PerBranch;
    int fillLimit = 65536;   // Max cells a flood fill may repaint
    uint64_t seed = 0;       // Seed for the host's SeededRandom
    bool verboseLog = false; // Painters raise the log category to debug
};

/**
 * Paint color onto positions, bridging to the surrounding terrain.
 *
 * 1. Every position gets color.
 * 2. Ring expansion adds bridging colors around them.
 * 3. Painted cells plus their 8-neighborhoods are re-resolved inside-out.
 */
void SmartPaint(
    ITileMap& map,
    const ICatalog& catalog,
    const PositionSet& positions,
    int color,
    IRandomSource& random,
    const PaintOptions& options = PaintOptions(),
    PaintReport* report = nullptr
);

/**
 * Painting front end bound to one catalog and one random source.
 */
class SmartPainter {
public:
    SmartPainter(
        const ICatalog& catalog,
        IRandomSource& random,
        const PaintOptions& options = PaintOptions()
    );

    void Paint(
        ITileMap& map,
        const PositionSet& positions,
        int color,
        PaintReport* report = nullptr
    ) const;

    // Single-cell brush
    void PaintAt(ITileMap& map, int x, int y, int color,
                 PaintReport* report = nullptr) const;

    /**
     * Flood fill the same-color region around (x, y) with color.
     * @return false when nothing was painted (empty start cell, region
     *         already that color, or region larger than fillLimit)
     */
    bool Fill(ITileMap& map, int x, int y, int color,
              PaintReport* report = nullptr) const;

    const PaintOptions& Options() const { return m_options; }

private:
    const ICatalog& m_catalog;
    IRandomSource& m_random;
    PaintOptions m_options;
};

} // namespace Tessera
