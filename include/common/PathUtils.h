#pragma once

#include <string>
#include <filesystem>

namespace kitbt {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Absolute paths pass through; relative paths resolve against the working
    // directory first, then against the executable directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace kitbt
