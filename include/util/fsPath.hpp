#pragma once

#include <filesystem>
#include <iterator>

namespace tmr::util {

namespace fs = std::filesystem;

inline fs::path common_path_prefix(const fs::path& a, const fs::path& b) {
    fs::path result;
    auto ait = a.begin();
    auto bit = b.begin();

    while (ait != a.end() && bit != b.end() && *ait == *bit) {
        result /= *ait;
        ++ait;
        ++bit;
    }

    return result;
}

// Absolute, symlink-resolved where the path exists, without a trailing separator
inline fs::path normalizeRoot(const fs::path& path) {
    auto norm = fs::weakly_canonical(fs::absolute(path)).lexically_normal();
    if (norm.has_relative_path() && norm.filename().empty()) norm = norm.parent_path();
    return norm;
}

// True when child is parent or lies below it, both already normalized
inline bool isSubpath(const fs::path& parent, const fs::path& child) {
    const auto prefix = common_path_prefix(parent, child);
    return std::distance(prefix.begin(), prefix.end()) == std::distance(parent.begin(), parent.end());
}

}
