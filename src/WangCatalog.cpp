#include "WangCatalog.h"
#include "Model.h"

namespace Tessera {

std::string CatalogTypeToString(CatalogType type) {
    switch (type) {
        case CatalogType::Corner: return "corner";
        case CatalogType::Edge: return "edge";
        case CatalogType::Mixed: return "mixed";
        default: return "corner";
    }
}

CatalogType CatalogTypeFromString(const std::string& str) {
    if (str == "edge") return CatalogType::Edge;
    if (str == "mixed") return CatalogType::Mixed;
    return CatalogType::Corner;
}

WangCatalog::WangCatalog(CatalogType type, const std::string& name)
    : m_type(type), m_name(name) {
    m_distances.assign(1, std::vector<int>(1, 0));
}

int WangCatalog::AddColor(
    const std::string& name,
    const Color& color,
    float probability
) {
    m_colors.push_back({name, color, probability});

    // Grow the matrix, new pairs start unreachable
    const std::size_t n = m_colors.size() + 1;
    for (auto& row : m_distances) {
        row.resize(n, kUnreachable);
    }
    m_distances.resize(n, std::vector<int>(n, kUnreachable));

    const int id = static_cast<int>(m_colors.size());
    m_distances[id][id] = 0;
    return id;
}

const WangColor* WangCatalog::FindColor(int colorId) const {
    if (!InRange(colorId)) {
        return nullptr;
    }
    return &m_colors[colorId - 1];
}

void WangCatalog::AddVariant(
    const ColorVector& colors,
    const TileRef& tile,
    float probability
) {
    m_variants.push_back({colors, tile, probability});
    m_tileColors[tile] = colors;
}

void WangCatalog::SetDistance(int colorA, int colorB, int distance) {
    if (!InRange(colorA) || !InRange(colorB)) {
        return;
    }
    const int value = distance < 0 ? kUnreachable : distance;
    m_distances[colorA][colorB] = value;
    m_distances[colorB][colorA] = value;
}

void WangCatalog::Clear() {
    m_colors.clear();
    m_variants.clear();
    m_tileColors.clear();
    m_distances.assign(1, std::vector<int>(1, 0));
}

void WangCatalog::ForEachVariant(
    const std::function<void(const TileVariant&)>& fn
) const {
    for (const auto& variant : m_variants) {
        fn(variant);
    }
}

std::optional<ColorVector> WangCatalog::ColorVectorOf(const TileRef& tile) const {
    auto it = m_tileColors.find(tile);
    if (it == m_tileColors.end()) {
        return std::nullopt;
    }
    return it->second;
}

int WangCatalog::Distance(int colorA, int colorB) const {
    if (colorA == colorB) return 0;
    if (colorA <= 0 || colorB <= 0) return 0;  // Wildcards never cost
    if (!InRange(colorA) || !InRange(colorB)) return kUnreachable;
    return m_distances[colorA][colorB];
}

float WangCatalog::Probability(const TileVariant& variant) const {
    float prob = variant.probability;
    for (int i = 0; i < kSlotCount; ++i) {
        const WangColor* color = FindColor(variant.colors.IndexColor(i));
        if (color) {
            prob *= color->probability;
        }
    }
    return prob;
}

} // namespace Tessera
