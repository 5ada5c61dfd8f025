#pragma once

#include "../Random.h"
#include <utility>
#include <vector>

namespace Tessera {

/**
 * Weighted random choice among equally scored candidates.
 * Candidates keep insertion order; weights are cumulative.
 */
template <typename T>
class RandomPicker {
public:
    void Add(const T& value, float weight) {
        if (weight > 0.0f) {
            m_total += weight;
        }
        m_items.push_back({value, m_total});
    }

    void Clear() {
        m_items.clear();
        m_total = 0.0;
    }

    bool IsEmpty() const { return m_items.empty(); }
    std::size_t Size() const { return m_items.size(); }
    double TotalWeight() const { return m_total; }

    /**
     * Draw r in [0, total] and return the first candidate whose cumulative
     * weight reaches r. Zero-weight candidates never win a draw.
     * With no positive weight at all, the last candidate is returned.
     * Must not be called on an empty picker.
     */
    const T& Pick(IRandomSource& random) const {
        if (m_items.size() == 1 || m_total <= 0.0) {
            return m_items.back().first;
        }

        const double r = random.Uniform(m_total);
        double previous = 0.0;
        for (const auto& item : m_items) {
            if (item.second > previous && r <= item.second) {
                return item.first;
            }
            previous = item.second;
        }
        return m_items.back().first;
    }

private:
    std::vector<std::pair<T, double>> m_items;  // value, cumulative weight
    double m_total = 0.0;
};

} // namespace Tessera
