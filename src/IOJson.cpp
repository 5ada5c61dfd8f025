#include "IOJson.h"
#include "Limits.h"
#include "Log.h"
#include "WangCatalog.h"
#include "paint/SmartPaint.h"
#include "platform/Fs.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cfloat>
#include <cstdint>
#include <limits>
#include <optional>

using json = nlohmann::json;

namespace Tessera {

// Helper: Convert RingPolicy to string
static std::string RingPolicyToString(RingPolicy policy) {
    switch (policy) {
        case RingPolicy::PerBranch: return "perBranch";
        case RingPolicy::SingleColor: return "singleColor";
        default: return "perBranch";
    }
}

// Helper: Parse RingPolicy from string
static RingPolicy RingPolicyFromString(const std::string& str) {
    if (str == "singleColor") return RingPolicy::SingleColor;
    return RingPolicy::PerBranch;
}

// Integer JSON number within [lo, hi]. Floats, strings and out-of-range
// values give nullopt, so nothing is narrowed blindly.
static std::optional<int64_t> IntegerInRange(const json& value,
                                             int64_t lo, int64_t hi) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    if (value.is_number_unsigned()) {
        const uint64_t u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        const int64_t v = static_cast<int64_t>(u);
        if (v < lo || v > hi) return std::nullopt;
        return v;
    }
    const int64_t v = value.get<int64_t>();
    if (v < lo || v > hi) return std::nullopt;
    return v;
}

// Integer JSON number clamped to [lo, hi], nullopt if not an integer
static std::optional<int> ClampedInt(const json& value, int lo, int hi) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    if (value.is_number_unsigned()) {
        const uint64_t u = value.get<uint64_t>();
        return u > static_cast<uint64_t>(hi) ? hi : std::max(lo, static_cast<int>(u));
    }
    const int64_t v = value.get<int64_t>();
    return static_cast<int>(std::clamp<int64_t>(v, lo, hi));
}

// Optional "probability" key: defaults to 1, negative reads as 0
static std::optional<float> ReadWeight(const json& object) {
    if (!object.contains("probability")) {
        return 1.0f;
    }
    const json& value = object["probability"];
    if (!value.is_number()) {
        return std::nullopt;
    }
    const double weight = value.get<double>();
    if (weight > FLT_MAX) {
        return std::nullopt;
    }
    return static_cast<float>(std::max(0.0, weight));
}

// ============================================================================
// Catalog
// ============================================================================

std::string IOJson::SaveCatalogToString(const WangCatalog& catalog) {
    json j;

    j["version"] = 1;
    j["name"] = catalog.Name();
    j["type"] = CatalogTypeToString(catalog.Type());

    // Colors
    j["colors"] = json::array();
    for (const auto& color : catalog.Colors()) {
        j["colors"].push_back({
            {"name", color.name},
            {"color", color.color.ToHex(false)},
            {"probability", color.probability}
        });
    }

    // Variants
    j["variants"] = json::array();
    for (const auto& variant : catalog.Variants()) {
        json jVariant = {
            {"tile", variant.tile.tileId},
            {"colors", variant.colors.ToArray()}
        };

        // Optional fields (only if non-default)
        if (variant.tile.flipH || variant.tile.flipV || variant.tile.flipD) {
            jVariant["flip"] = json::array({
                variant.tile.flipH, variant.tile.flipV, variant.tile.flipD
            });
        }
        if (variant.probability != 1.0f) {
            jVariant["probability"] = variant.probability;
        }

        j["variants"].push_back(jVariant);
    }

    // Distance matrix, row i is color i + 1
    const int count = catalog.ColorCount();
    j["distances"] = json::array();
    for (int a = 1; a <= count; ++a) {
        json row = json::array();
        for (int b = 1; b <= count; ++b) {
            row.push_back(catalog.Distance(a, b));
        }
        j["distances"].push_back(row);
    }

    return j.dump(2);  // Pretty print with 2-space indent
}

bool IOJson::LoadCatalogFromString(
    const std::string& jsonStr,
    WangCatalog& outCatalog
) {
    // Security: check JSON size before parsing
    if (jsonStr.size() > Limits::MAX_CATALOG_JSON_SIZE) {
        SDL_LogError(TESSERA_LOG_CATEGORY, "Catalog JSON too large (%zu bytes)",
                     jsonStr.size());
        return false;
    }

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            SDL_LogError(TESSERA_LOG_CATEGORY, "Catalog must be a JSON object");
            return false;
        }

        if (j.contains("version") && IntegerInRange(j["version"], 1, 1) != 1) {
            SDL_LogError(TESSERA_LOG_CATEGORY, "Unsupported catalog version %s",
                         j["version"].dump().c_str());
            return false;
        }

        WangCatalog catalog(
            CatalogTypeFromString(j.value("type", "corner")),
            j.value("name", "")
        );

        // Colors
        if (j.contains("colors")) {
            const auto& colors = j["colors"];
            if (!colors.is_array() || colors.size() > Limits::MAX_COLORS) {
                SDL_LogError(TESSERA_LOG_CATEGORY, "Invalid color list");
                return false;
            }
            for (const auto& color : colors) {
                const auto weight = ReadWeight(color);
                if (!weight) {
                    SDL_LogError(TESSERA_LOG_CATEGORY, "Invalid color probability");
                    return false;
                }
                catalog.AddColor(
                    color.value("name", ""),
                    Color::FromHex(color.value("color", "#000000")),
                    *weight
                );
            }
        }

        // Variants
        if (j.contains("variants")) {
            const auto& variants = j["variants"];
            if (!variants.is_array() || variants.size() > Limits::MAX_VARIANTS) {
                SDL_LogError(TESSERA_LOG_CATEGORY, "Invalid variant list");
                return false;
            }
            for (const auto& variant : variants) {
                if (!variant.contains("colors") || !variant["colors"].is_array() ||
                    variant["colors"].size() != kSlotCount) {
                    SDL_LogError(TESSERA_LOG_CATEGORY,
                                 "Variant needs exactly %d colors", kSlotCount);
                    return false;
                }

                std::array<int, kSlotCount> slots{};
                for (int i = 0; i < kSlotCount; ++i) {
                    const auto c = IntegerInRange(variant["colors"][i], 0,
                                                  catalog.ColorCount());
                    if (!c) {
                        SDL_LogError(TESSERA_LOG_CATEGORY,
                                     "Variant color %s out of range",
                                     variant["colors"][i].dump().c_str());
                        return false;
                    }
                    slots[i] = static_cast<int>(*c);
                }

                std::optional<int64_t> tileId = -1;
                if (variant.contains("tile")) {
                    tileId = IntegerInRange(variant["tile"], -1,
                                            std::numeric_limits<int>::max());
                }
                const auto weight = ReadWeight(variant);
                if (!tileId || !weight) {
                    SDL_LogError(TESSERA_LOG_CATEGORY,
                                 "Invalid variant tile or probability");
                    return false;
                }

                TileRef tile(static_cast<int>(*tileId));
                if (variant.contains("flip") && variant["flip"].size() == 3) {
                    tile.flipH = variant["flip"][0].get<bool>();
                    tile.flipV = variant["flip"][1].get<bool>();
                    tile.flipD = variant["flip"][2].get<bool>();
                }

                catalog.AddVariant(ColorVector::FromArray(slots), tile, *weight);
            }
        }

        // Distances
        if (j.contains("distances")) {
            const auto& rows = j["distances"];
            const std::size_t count = static_cast<std::size_t>(catalog.ColorCount());
            if (!rows.is_array() || rows.size() != count) {
                SDL_LogError(TESSERA_LOG_CATEGORY,
                             "Distance matrix must be %zu x %zu", count, count);
                return false;
            }
            for (std::size_t a = 0; a < count; ++a) {
                if (!rows[a].is_array() || rows[a].size() != count) {
                    SDL_LogError(TESSERA_LOG_CATEGORY,
                                 "Distance row %zu has wrong size", a + 1);
                    return false;
                }
                for (std::size_t b = 0; b < count; ++b) {
                    const auto d = IntegerInRange(rows[a][b],
                        std::numeric_limits<int>::min(),
                        std::numeric_limits<int>::max());
                    if (!d) {
                        SDL_LogError(TESSERA_LOG_CATEGORY,
                                     "Distance %zu,%zu is not an int", a + 1, b + 1);
                        return false;
                    }
                    catalog.SetDistance(static_cast<int>(a + 1),
                                        static_cast<int>(b + 1),
                                        static_cast<int>(*d));
                }
            }
        }

        outCatalog = catalog;
        return true;

    } catch (const std::exception& e) {
        SDL_LogError(TESSERA_LOG_CATEGORY, "Catalog parse error: %s", e.what());
        return false;
    }
}

bool IOJson::LoadCatalogFromFile(const std::string& path, WangCatalog& outCatalog) {
    auto content = Platform::ReadTextFile(path, Limits::MAX_CATALOG_JSON_SIZE);
    if (!content) {
        SDL_LogError(TESSERA_LOG_CATEGORY,
                     "Cannot read %s (missing or too large)", path.c_str());
        return false;
    }
    return LoadCatalogFromString(*content, outCatalog);
}

bool IOJson::SaveCatalogToFile(const WangCatalog& catalog, const std::string& path) {
    if (!Platform::WriteTextFile(path, SaveCatalogToString(catalog))) {
        SDL_LogError(TESSERA_LOG_CATEGORY, "Cannot write %s", path.c_str());
        return false;
    }
    return true;
}

// ============================================================================
// Options
// ============================================================================

std::string IOJson::SaveOptionsToString(const PaintOptions& options) {
    json j;
    j["ringPolicy"] = RingPolicyToString(options.ringPolicy);
    j["fillLimit"] = options.fillLimit;
    j["seed"] = options.seed;
    j["verboseLog"] = options.verboseLog;
    return j.dump(2);
}

bool IOJson::LoadOptionsFromString(
    const std::string& jsonStr,
    PaintOptions& outOptions
) {
    if (jsonStr.size() > Limits::MAX_OPTIONS_JSON_SIZE) {
        SDL_LogError(TESSERA_LOG_CATEGORY, "Options JSON too large");
        return false;
    }

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            SDL_LogError(TESSERA_LOG_CATEGORY, "Options must be a JSON object");
            return false;
        }
        PaintOptions options = outOptions;

        if (j.contains("ringPolicy")) {
            options.ringPolicy = RingPolicyFromString(
                j["ringPolicy"].get<std::string>()
            );
        }
        if (j.contains("fillLimit")) {
            const auto limit = ClampedInt(j["fillLimit"],
                Limits::MIN_FILL_LIMIT, Limits::MAX_FILL_LIMIT);
            if (!limit) {
                SDL_LogError(TESSERA_LOG_CATEGORY, "fillLimit must be an integer");
                return false;
            }
            options.fillLimit = *limit;
        }
        if (j.contains("seed")) {
            if (!j["seed"].is_number_unsigned()) {
                SDL_LogError(TESSERA_LOG_CATEGORY,
                             "seed must be a non-negative integer");
                return false;
            }
            options.seed = j["seed"].get<uint64_t>();
        }
        if (j.contains("verboseLog")) {
            options.verboseLog = j["verboseLog"].get<bool>();
        }

        outOptions = options;
        return true;

    } catch (const std::exception& e) {
        SDL_LogError(TESSERA_LOG_CATEGORY, "Options parse error: %s", e.what());
        return false;
    }
}

bool IOJson::LoadOptionsFromFile(const std::string& path, PaintOptions& outOptions) {
    auto content = Platform::ReadTextFile(path, Limits::MAX_OPTIONS_JSON_SIZE);
    if (!content) {
        // No options file yet, keep defaults
        return false;
    }
    return LoadOptionsFromString(*content, outOptions);
}

} // namespace Tessera
