#pragma once

#include "Catalog.h"
#include "Color.h"
#include <string>
#include <unordered_map>
#include <vector>

namespace Tessera {

// ============================================================================
// Terrain colors
// ============================================================================

struct WangColor {
    std::string name;
    Color color;              // Editor swatch
    float probability = 1.0f; // Weight for random selection
};

// ============================================================================
// WangCatalog - in-memory ICatalog
// ============================================================================

/**
 * Ready-made catalog for hosts that keep their Wang set in memory.
 *
 * Variants and the distance matrix are supplied as-is: this class does not
 * derive rotations or shortest paths. Unset distances are unreachable.
 */
class WangCatalog : public ICatalog {
public:
    explicit WangCatalog(CatalogType type = CatalogType::Corner,
                         const std::string& name = "");

    // Colors (1-based ids, assigned in insertion order)
    int AddColor(const std::string& name, const Color& color,
                 float probability = 1.0f);
    const WangColor* FindColor(int colorId) const;
    const std::vector<WangColor>& Colors() const { return m_colors; }

    // Variants
    void AddVariant(const ColorVector& colors, const TileRef& tile,
                    float probability = 1.0f);
    const std::vector<TileVariant>& Variants() const { return m_variants; }

    /**
     * Record the distance between two colors (stored symmetrically).
     * Negative values mean unreachable.
     */
    void SetDistance(int colorA, int colorB, int distance);

    void SetType(CatalogType type) { m_type = type; }
    const std::string& Name() const { return m_name; }
    void SetName(const std::string& name) { m_name = name; }

    void Clear();

    // ICatalog
    void ForEachVariant(
        const std::function<void(const TileVariant&)>& fn
    ) const override;
    std::optional<ColorVector> ColorVectorOf(const TileRef& tile) const override;
    int Distance(int colorA, int colorB) const override;
    int ColorCount() const override { return static_cast<int>(m_colors.size()); }
    float Probability(const TileVariant& variant) const override;
    CatalogType Type() const override { return m_type; }

private:
    bool InRange(int colorId) const {
        return colorId >= 1 && colorId <= ColorCount();
    }

    CatalogType m_type;
    std::string m_name;
    std::vector<WangColor> m_colors;
    std::vector<TileVariant> m_variants;
    std::unordered_map<TileRef, ColorVector, TileRefHash> m_tileColors;
    std::vector<std::vector<int>> m_distances;  // [a][b], index 0 unused
};

// Catalog type <-> "corner" / "edge" / "mixed"
std::string CatalogTypeToString(CatalogType type);
CatalogType CatalogTypeFromString(const std::string& str);

} // namespace Tessera
