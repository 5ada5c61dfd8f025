#include "Fs.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace Tessera {
namespace Platform {

std::optional<std::string> ReadTextFile(const std::string& path,
                                        std::size_t maxBytes) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec || size > maxBytes) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::string content(static_cast<std::size_t>(size), '\0');
    if (size > 0 && !file.read(&content[0], static_cast<std::streamsize>(size))) {
        return std::nullopt;
    }
    return content;
}

bool WriteTextFile(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(file);
}

bool FileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace Platform
} // namespace Tessera
