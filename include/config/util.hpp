#pragma once

#include <string>
#include <cstdint>
#include <stdexcept>

namespace tmr::config {

inline uintmax_t parseKbMbOrGbToByte(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    const auto endsWith = [&](const char* suffix) {
        const std::string s(suffix);
        return str.size() > s.size() && str.compare(str.size() - s.size(), s.size(), s) == 0;
    };

    if (endsWith("GB") || endsWith("gb")) return std::stoull(str.substr(0, str.size() - 2)) * 1024 * 1024 * 1024;
    if (endsWith("MB") || endsWith("mb")) return std::stoull(str.substr(0, str.size() - 2)) * 1024 * 1024;
    if (endsWith("KB") || endsWith("kb")) return std::stoull(str.substr(0, str.size() - 2)) * 1024;
    if (endsWith("G") || endsWith("g")) return std::stoull(str.substr(0, str.size() - 1)) * 1024 * 1024 * 1024;
    if (endsWith("M") || endsWith("m")) return std::stoull(str.substr(0, str.size() - 1)) * 1024 * 1024;
    if (endsWith("K") || endsWith("k")) return std::stoull(str.substr(0, str.size() - 1)) * 1024;
    if (endsWith("B") || endsWith("b")) return std::stoull(str.substr(0, str.size() - 1));

    // Assume MB if no suffix
    return std::stoull(str) * 1024 * 1024;
}

inline std::string bytesToKbMbOrGbStr(const uintmax_t bytes) {
    if (bytes != 0 && bytes % (1024 * 1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024 * 1024)) + "GB";
    if (bytes != 0 && bytes % (1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024)) + "MB";
    if (bytes % 1024 == 0) return std::to_string(bytes / 1024) + "KB";
    return std::to_string(bytes) + "B";
}

}
