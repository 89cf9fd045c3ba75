#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"

#include <algorithm>
#include <thread>
#include <yaml-cpp/yaml.h>

namespace tmr::config {

unsigned int SyncConfig::effectiveScanWorkers() const {
    if (scan_workers > 0) return scan_workers;
    return std::max(std::thread::hardware_concurrency(), 2u);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) return cfg;
        if (!root.IsMap()) throw ConfigError("Config root must be a map: " + path.string());

        if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load config '" + path.string() + "': " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid value in config '" + path.string() + "': " + e.what());
    }

    if (cfg.sync.max_concurrency == 0) throw ConfigError("sync.max_concurrency must be > 0");
    if (cfg.sync.digest_workers == 0) throw ConfigError("sync.digest_workers must be > 0");
    if (cfg.sync.copy_buffer_size == 0) throw ConfigError("sync.copy_buffer_size must be > 0");
    if (cfg.sync.copy_buffer_size > MAX_COPY_BUFFER_SIZE)
        throw ConfigError("sync.copy_buffer_size must be at most " + bytesToKbMbOrGbStr(MAX_COPY_BUFFER_SIZE));

    return cfg;
}

std::string colorModeToString(const ColorMode mode) {
    switch (mode) {
        case ColorMode::Auto: return "auto";
        case ColorMode::Always: return "always";
        case ColorMode::Never: return "never";
    }
    return "unknown";
}

ColorMode parseColorMode(const std::string& str) {
    if (str == "auto") return ColorMode::Auto;
    if (str == "always") return ColorMode::Always;
    if (str == "never") return ColorMode::Never;
    throw std::invalid_argument("Invalid color mode: " + str);
}

} // namespace tmr::config
