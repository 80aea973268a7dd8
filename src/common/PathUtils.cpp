#include "common/PathUtils.h"

#include <system_error>

namespace emis {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    const std::filesystem::path p(relative_path);
    if (p.is_absolute()) {
        return p;
    }
    // Prefer the working directory when the file is already there (tests, ad-hoc runs).
    if (std::filesystem::exists(p)) {
        return std::filesystem::absolute(p);
    }
    return getExecutableDir() / relative_path;
}

std::filesystem::path PathUtils::getConfigDir() {
    return getExecutableDir() / "config";
}

std::filesystem::path PathUtils::getLogsDir() {
    return getExecutableDir() / "logs";
}

} // namespace utils
} // namespace emis
