#include "common/PathUtils.h"

#include <system_error>

namespace zenith {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path(ec);
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& path) {
    const std::filesystem::path requested(path);
    if (requested.empty() || requested.is_absolute()) {
        return requested;
    }

    std::error_code ec;
    if (std::filesystem::exists(requested, ec)) {
        return std::filesystem::absolute(requested, ec);
    }
    return getExecutableDir() / requested;
}

bool PathUtils::ensureParentDir(const std::filesystem::path& file_path) {
    if (!file_path.has_parent_path()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    return !ec;
}

} // namespace utils
} // namespace zenith
