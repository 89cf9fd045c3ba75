#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <cstdint>
#include <unordered_map>
#include <sys/types.h>

namespace tmr::sync::model {

struct Entry {
    std::string relativePath;              // '/'-separated, never contains the scan root
    std::filesystem::path absolutePath;
    uintmax_t size = 0;                    // files only
    std::filesystem::file_time_type modifiedTime{};
    bool isDirectory = false;
    bool isSymlink = false;                // target side only, never followed, always replaced
    mode_t permissionMode = 0;             // permission bits only

    [[nodiscard]] std::string kindString() const {
        if (isSymlink) return "symlink";
        return isDirectory ? "directory" : "file";
    }
};

using Mapping = std::unordered_map<std::string, std::shared_ptr<const Entry>>;

// Number of separators, so "a" is 0 and "a/b/c" is 2
inline size_t pathDepth(const std::string& relativePath) {
    size_t depth = 0;
    for (const char c : relativePath) if (c == '/') ++depth;
    return depth;
}

// Modification time floored to whole seconds since the clock epoch
int64_t truncatedSeconds(std::filesystem::file_time_type t);

}
