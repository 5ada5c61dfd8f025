#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Tessera {

// ============================================================================
// Directions
// ============================================================================

// Slot indices in clockwise order starting at Top.
// Even slots are edges, odd slots are corners.
enum Direction : int {
    Top = 0,
    TopRight = 1,
    Right = 2,
    BottomRight = 3,
    Bottom = 4,
    BottomLeft = 5,
    Left = 6,
    TopLeft = 7
};

constexpr int kSlotCount = 8;
constexpr int kSlotBits = 8;
constexpr uint64_t kSlotMask = 0xFF;

// Catalog flavour: which slots a paint color controls
enum class CatalogType {
    Corner,
    Edge,
    Mixed
};

/**
 * Slots that carry color for a catalog type.
 * Corner: 1, 3, 5, 7. Edge: 0, 2, 4, 6. Mixed: all eight.
 */
std::vector<int> ActiveSlots(CatalogType type);

// ============================================================================
// SlotMask
// ============================================================================

/**
 * One bit per slot. Bit i set means slot i is a hard constraint.
 */
struct SlotMask {
    uint8_t bits = 0;

    bool Test(int slot) const { return (bits >> slot) & 1u; }
    void Set(int slot) { bits = static_cast<uint8_t>(bits | (1u << slot)); }

    // 0xFF in every byte whose bit is set
    uint64_t ByteMask() const;

    bool operator==(const SlotMask& other) const { return bits == other.bits; }
    bool operator!=(const SlotMask& other) const { return bits != other.bits; }
};

// ============================================================================
// ColorVector
// ============================================================================

/**
 * Per-direction color descriptor of a tile, or the desired constraints of a
 * cell. Eight 8-bit slots packed into one 64-bit value, slot i at bits
 * [8i, 8i + 8). Color 0 is "don't care".
 *
 * The layout is shared bit-for-bit with external catalogs.
 */
class ColorVector {
public:
    ColorVector() = default;
    explicit ColorVector(uint64_t value) : m_value(value) {}

    static ColorVector FromArray(const std::array<int, kSlotCount>& colors);
    std::array<int, kSlotCount> ToArray() const;

    // Uniform constructors
    static ColorVector AllCorners(int color);
    static ColorVector AllEdges(int color);
    static ColorVector All(int color);

    int IndexColor(int slot) const {
        return static_cast<int>((m_value >> (slot * kSlotBits)) & kSlotMask);
    }
    void SetIndexColor(int slot, int color);

    uint64_t Value() const { return m_value; }

    SlotMask Mask() const;

    // True when the masked slots of both vectors agree
    bool MatchesMasked(const ColorVector& other, const SlotMask& mask) const {
        const uint64_t bytes = mask.ByteMask();
        return (m_value & bytes) == (other.m_value & bytes);
    }

    bool IsEmpty() const { return m_value == 0; }
    bool HasColor(int color) const;

    /**
     * Most frequent nonzero slot value, or 0 when every slot is empty.
     * Ties go to the color whose first occurrence has the lowest slot.
     */
    int DominantColor() const;

    std::string ToString() const;

    bool operator==(const ColorVector& other) const {
        return m_value == other.m_value;
    }
    bool operator!=(const ColorVector& other) const {
        return m_value != other.m_value;
    }

private:
    uint64_t m_value = 0;
};

} // namespace Tessera
