#pragma once

#include <filesystem>
#include <string>

namespace tradegate {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable
    static std::filesystem::path getExecutableDir();

    // Absolute paths are returned unchanged. A relative path is taken from the
    // working directory when it exists there, otherwise from the executable
    // directory when it exists there, otherwise from the working directory.
    static std::filesystem::path resolve(const std::string& path);
};

} // namespace utils
} // namespace tradegate
