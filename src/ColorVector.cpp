#include "ColorVector.h"
#include <sstream>

namespace Tessera {

std::vector<int> ActiveSlots(CatalogType type) {
    switch (type) {
        case CatalogType::Corner: return {TopRight, BottomRight, BottomLeft, TopLeft};
        case CatalogType::Edge: return {Top, Right, Bottom, Left};
        case CatalogType::Mixed: break;
    }
    return {0, 1, 2, 3, 4, 5, 6, 7};
}

// ============================================================================
// SlotMask implementation
// ============================================================================

uint64_t SlotMask::ByteMask() const {
    uint64_t bytes = 0;
    for (int i = 0; i < kSlotCount; ++i) {
        if (Test(i)) {
            bytes |= kSlotMask << (i * kSlotBits);
        }
    }
    return bytes;
}

// ============================================================================
// ColorVector implementation
// ============================================================================

ColorVector ColorVector::FromArray(const std::array<int, kSlotCount>& colors) {
    ColorVector result;
    for (int i = 0; i < kSlotCount; ++i) {
        result.SetIndexColor(i, colors[i]);
    }
    return result;
}

std::array<int, kSlotCount> ColorVector::ToArray() const {
    std::array<int, kSlotCount> colors{};
    for (int i = 0; i < kSlotCount; ++i) {
        colors[i] = IndexColor(i);
    }
    return colors;
}

ColorVector ColorVector::AllCorners(int color) {
    return FromArray({0, color, 0, color, 0, color, 0, color});
}

ColorVector ColorVector::AllEdges(int color) {
    return FromArray({color, 0, color, 0, color, 0, color, 0});
}

ColorVector ColorVector::All(int color) {
    return FromArray({color, color, color, color, color, color, color, color});
}

void ColorVector::SetIndexColor(int slot, int color) {
    const int shift = slot * kSlotBits;
    m_value = (m_value & ~(kSlotMask << shift)) |
              ((static_cast<uint64_t>(color) & kSlotMask) << shift);
}

SlotMask ColorVector::Mask() const {
    SlotMask mask;
    for (int i = 0; i < kSlotCount; ++i) {
        if (IndexColor(i) != 0) {
            mask.Set(i);
        }
    }
    return mask;
}

bool ColorVector::HasColor(int color) const {
    for (int i = 0; i < kSlotCount; ++i) {
        if (IndexColor(i) == color) {
            return true;
        }
    }
    return false;
}

int ColorVector::DominantColor() const {
    // Slot order doubles as first-seen order for tie-breaking
    int colors[kSlotCount];
    int counts[kSlotCount];
    int distinct = 0;

    for (int i = 0; i < kSlotCount; ++i) {
        const int c = IndexColor(i);
        if (c == 0) continue;

        int j = 0;
        while (j < distinct && colors[j] != c) ++j;
        if (j == distinct) {
            colors[distinct] = c;
            counts[distinct] = 0;
            ++distinct;
        }
        ++counts[j];
    }

    int best = 0;
    int bestCount = 0;
    for (int j = 0; j < distinct; ++j) {
        if (counts[j] > bestCount) {
            best = colors[j];
            bestCount = counts[j];
        }
    }
    return best;
}

std::string ColorVector::ToString() const {
    std::ostringstream ss;
    ss << "[";
    for (int i = 0; i < kSlotCount; ++i) {
        if (i > 0) ss << ",";
        ss << IndexColor(i);
    }
    ss << "]";
    return ss.str();
}

} // namespace Tessera
