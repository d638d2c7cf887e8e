#include "common/PathUtils.h"

#ifdef _WIN32
#include <Windows.h>
#endif

#include <system_error>

namespace tradegate {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
#ifdef _WIN32
    char buffer[MAX_PATH];
    GetModuleFileNameA(NULL, buffer, MAX_PATH);
    std::filesystem::path exe_path(buffer);
    return exe_path.parent_path();
#else
    std::error_code ec;
    auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
#endif
}

std::filesystem::path PathUtils::resolve(const std::string& path) {
    std::filesystem::path candidate(path);
    if (candidate.empty() || candidate.is_absolute()) {
        return candidate;
    }

    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
        return candidate;
    }
    auto beside_exe = getExecutableDir() / candidate;
    if (std::filesystem::exists(beside_exe, ec)) {
        return beside_exe;
    }
    return candidate;
}

} // namespace utils
} // namespace tradegate
