#include <laurel/core/filesystem.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace laurel::core {

std::string FileSystem::read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};

    return std::string(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) return false;
    file << text;
    return file.good();
}

bool FileSystem::remove(const std::string& path) {
    std::error_code ec;
    return std::filesystem::remove(path, ec) && !ec;
}

} // namespace laurel::core
