#include "TileGrid.h"
#include <algorithm>

namespace Tessera {

TileGrid::TileGrid(int width, int height)
    : m_width(width), m_height(height) {}

TileRow* TileGrid::FindRow(int y) {
    auto it = std::find_if(m_rows.begin(), m_rows.end(),
        [&](const TileRow& row) { return row.y == y; });
    return it != m_rows.end() ? &(*it) : nullptr;
}

const TileRow* TileGrid::FindRow(int y) const {
    auto it = std::find_if(m_rows.begin(), m_rows.end(),
        [&](const TileRow& row) { return row.y == y; });
    return it != m_rows.end() ? &(*it) : nullptr;
}

TileRef TileGrid::CellAt(int x, int y) const {
    if (!InBounds(x, y)) {
        return TileRef();
    }

    const TileRow* row = FindRow(y);
    if (!row) {
        return TileRef();
    }

    for (const auto& run : row->runs) {
        if (x >= run.startX && x < run.startX + run.count) {
            return run.tile;
        }
    }
    return TileRef();
}

void TileGrid::SetCell(int x, int y, const TileRef& tile) {
    if (!InBounds(x, y) || CellAt(x, y) == tile) {
        return;
    }

    TileRow* row = FindRow(y);
    if (!row) {
        m_rows.push_back({y, {}});
        row = &m_rows.back();
    }
    std::vector<TileRun>& runs = row->runs;

    // First run reaching past x
    auto it = std::find_if(runs.begin(), runs.end(),
        [x](const TileRun& run) { return run.startX + run.count > x; });

    if (it != runs.end() && it->startX <= x) {
        const TileRun covering = *it;
        const int coveringEnd = covering.startX + covering.count;
        it = runs.erase(it);
        if (x + 1 < coveringEnd) {
            it = runs.insert(it, {x + 1, coveringEnd - (x + 1), covering.tile});
        }
        if (x > covering.startX) {
            it = runs.insert(it, {covering.startX, x - covering.startX, covering.tile}) + 1;
        }
    }

    if (!tile.IsEmpty()) {
        it = runs.insert(it, {x, 1, tile});

        auto next = it + 1;
        if (next != runs.end() && next->tile == tile && next->startX == x + 1) {
            it->count += next->count;
            runs.erase(next);
        }
        if (it != runs.begin()) {
            auto prev = it - 1;
            if (prev->tile == tile && prev->startX + prev->count == x) {
                prev->count += it->count;
                runs.erase(it);
            }
        }
    }

    if (runs.empty()) {
        m_rows.erase(std::remove_if(m_rows.begin(), m_rows.end(),
            [y](const TileRow& r) { return r.y == y; }), m_rows.end());
    }
}

void TileGrid::Fill(const TileRef& tile) {
    m_rows.clear();
    if (tile.IsEmpty() || m_width <= 0) {
        return;
    }
    for (int y = 0; y < m_height; ++y) {
        m_rows.push_back({y, {{0, m_width, tile}}});
    }
}

int TileGrid::RunCount() const {
    int count = 0;
    for (const auto& row : m_rows) {
        count += static_cast<int>(row.runs.size());
    }
    return count;
}

bool TileGrid::operator==(const TileGrid& other) const {
    if (m_width != other.m_width || m_height != other.m_height) {
        return false;
    }
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            if (CellAt(x, y) != other.CellAt(x, y)) {
                return false;
            }
        }
    }
    return true;
}

} // namespace Tessera
