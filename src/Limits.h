#pragma once

#include <cstddef>

namespace Tessera {

/**
 * Limits for catalog and options loading.
 * Reject oversized or hostile files before they can exhaust memory.
 */
namespace Limits {

// Maximum JSON file size before parsing (16 MB)
constexpr size_t MAX_CATALOG_JSON_SIZE = 16 * 1024 * 1024;
constexpr size_t MAX_OPTIONS_JSON_SIZE = 64 * 1024;

// A slot holds 8 bits and 0 is reserved
constexpr size_t MAX_COLORS = 255;
constexpr size_t MAX_VARIANTS = 65536;

// Flood fill bounds accepted from options files
constexpr int MIN_FILL_LIMIT = 1;
constexpr int MAX_FILL_LIMIT = 16 * 1024 * 1024;

}  // namespace Limits
}  // namespace Tessera
