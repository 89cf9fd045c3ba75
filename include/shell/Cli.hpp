#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace tmr::shell {

struct CliOptions {
    std::filesystem::path source;
    std::filesystem::path target;
    std::vector<std::string> excludes;
    bool dryRun = false;
    bool json = false;
    bool noColor = false;
    bool help = false;
    std::optional<spdlog::level::level_enum> verbosity;
    std::optional<std::filesystem::path> configPath;
};

// Throws UsageError on unknown flags, missing values or a wrong positional count
CliOptions parseCli(const std::vector<std::string>& args);

spdlog::level::level_enum parseVerbosity(const std::string& level);

std::string usage(const std::string& program = "treemirror");

}
