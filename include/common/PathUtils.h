#pragma once

#include <string>
#include <filesystem>

namespace emis {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable
    static std::filesystem::path getExecutableDir();

    // Absolute paths pass through; relative ones are anchored at the executable dir
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    static std::filesystem::path getConfigDir();

    static std::filesystem::path getLogsDir();
};

} // namespace utils
} // namespace emis
