#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

namespace ferry::util {

namespace fs = std::filesystem;

inline fs::path expandHome(const std::string& path) {
    if (path != "~" && !path.starts_with("~/")) return path;

    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return path.size() > 2 ? fs::path(home) / path.substr(2) : fs::path(home);
}

// Relative paths are anchored at the working directory.
inline fs::path resolveUserPath(const std::string& path) {
    return fs::absolute(expandHome(path)).lexically_normal();
}

}
