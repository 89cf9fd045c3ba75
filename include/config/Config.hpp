#pragma once

#include <filesystem>
#include <string>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace tmr::config {

constexpr static uintmax_t DEFAULT_COPY_BUFFER_SIZE = 1024 * 1024; // 1MB
constexpr static uintmax_t MAX_COPY_BUFFER_SIZE = 64 * 1024 * 1024; // allocated once per in-flight copy

enum class ColorMode { Auto, Always, Never };

struct SyncConfig {
    unsigned int max_concurrency = 10;
    unsigned int digest_workers = 4;
    unsigned int scan_workers = 0; // 0 = hardware concurrency
    uintmax_t copy_buffer_size = DEFAULT_COPY_BUFFER_SIZE;
    std::string ignore_file = ".sync-ignore";
    unsigned int plan_sample_size = 20;
    bool confirm_default = true; // answer taken on empty input
    ColorMode color = ColorMode::Auto;

    [[nodiscard]] unsigned int effectiveScanWorkers() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum treemirror = spdlog::level::info;   // Startup, summaries, shutdown
    spdlog::level::level_enum scan       = spdlog::level::info;   // Per-node access failures surface as warn
    spdlog::level::level_enum plan       = spdlog::level::info;   // Digest failures during comparison
    spdlog::level::level_enum digest     = spdlog::level::warn;
    spdlog::level::level_enum exec       = spdlog::level::info;   // Per-action failures, metadata warnings
    spdlog::level::level_enum shell      = spdlog::level::info;
    spdlog::level::level_enum config     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{}; // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    SyncConfig sync;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

std::string colorModeToString(ColorMode mode);
ColorMode parseColorMode(const std::string& str);

} // namespace tmr::config
