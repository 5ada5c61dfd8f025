#pragma once

#include "TileMap.h"
#include <vector>

namespace Tessera {

// ============================================================================
// Tiles (row-run encoding)
// ============================================================================

struct TileRun {
    int startX;
    int count;
    TileRef tile;
};

struct TileRow {
    int y;
    std::vector<TileRun> runs;  // Sorted by startX, never overlapping
};

/**
 * In-memory ITileMap storing each row as runs of identical tiles.
 * Large uniform terrain costs one run per row.
 *
 * Cells outside [0, width) x [0, height) read as empty and ignore writes.
 */
class TileGrid : public ITileMap {
public:
    TileGrid(int width, int height);

    // ITileMap
    TileRef CellAt(int x, int y) const override;
    void SetCell(int x, int y, const TileRef& tile) override;
    int Width() const override { return m_width; }
    int Height() const override { return m_height; }

    bool InBounds(int x, int y) const {
        return x >= 0 && x < m_width && y >= 0 && y < m_height;
    }

    // Set every cell to tile
    void Fill(const TileRef& tile);

    // Remove every tile
    void Clear() { m_rows.clear(); }

    // Number of stored runs (for tests and memory stats)
    int RunCount() const;

    const std::vector<TileRow>& Rows() const { return m_rows; }

    bool operator==(const TileGrid& other) const;
    bool operator!=(const TileGrid& other) const { return !(*this == other); }

private:
    TileRow* FindRow(int y);
    const TileRow* FindRow(int y) const;

    int m_width;
    int m_height;
    std::vector<TileRow> m_rows;
};

} // namespace Tessera
