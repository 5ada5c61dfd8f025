#pragma once

#include <string>

namespace Tessera {

class WangCatalog;
struct PaintOptions;

/**
 * JSON serialization for catalogs and painter options.
 * Loaders leave the output untouched on failure and log the reason.
 */
class IOJson {
public:
    /**
     * Save catalog to JSON string.
     * @param catalog Catalog to save
     * @return JSON string
     */
    static std::string SaveCatalogToString(const WangCatalog& catalog);

    /**
     * Load catalog from JSON string.
     * @param json JSON string
     * @param outCatalog Output catalog
     * @return true on success, false on error
     */
    static bool LoadCatalogFromString(const std::string& json,
                                      WangCatalog& outCatalog);

    /**
     * Load catalog from JSON file.
     * @param path File path
     * @param outCatalog Output catalog
     * @return true on success
     */
    static bool LoadCatalogFromFile(const std::string& path,
                                    WangCatalog& outCatalog);

    static bool SaveCatalogToFile(const WangCatalog& catalog,
                                  const std::string& path);

    /**
     * Painter options. Missing keys keep their defaults.
     */
    static std::string SaveOptionsToString(const PaintOptions& options);
    static bool LoadOptionsFromString(const std::string& json,
                                      PaintOptions& outOptions);
    static bool LoadOptionsFromFile(const std::string& path,
                                    PaintOptions& outOptions);
};

} // namespace Tessera
