#pragma once

#include <string>
#include <filesystem>

namespace stratlab {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (cwd when it cannot be determined)
    static std::filesystem::path getExecutableDir();

    // Resolves against the cwd first, then against the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace stratlab
