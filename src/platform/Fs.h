#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace Tessera {
namespace Platform {

/**
 * Read a whole text file, refusing files larger than maxBytes.
 * @param path File path
 * @param maxBytes Size cap checked before any byte is read
 * @return File contents, or nullopt if missing, unreadable or too large
 */
std::optional<std::string> ReadTextFile(const std::string& path,
                                        std::size_t maxBytes);

/**
 * Write text, replacing the file.
 * @return true on success
 */
bool WriteTextFile(const std::string& path, const std::string& text);

// True if a regular file exists at path
bool FileExists(const std::string& path);

} // namespace Platform
} // namespace Tessera
