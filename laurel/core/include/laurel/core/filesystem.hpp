#pragma once

#include <string>

namespace laurel::core {

struct FileSystem {
    static std::string read_text(const std::string& path);
    static bool write_text(const std::string& path, const std::string& text);
    static bool remove(const std::string& path);
};

} // namespace laurel::core
