#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <system_error>

namespace tmr::config {

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    std::call_once(init_flag_, [&]() {
        if (path) config_ = loadConfig(*path);
        else if (const auto found = resolvePath()) config_ = loadConfig(*found);
        else config_ = Config{};
        initialized_ = true;
    });
}

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        initialized_ = true;
    });
}

std::optional<std::filesystem::path> ConfigRegistry::resolvePath() {
    std::error_code ec;

    if (const char* env = std::getenv(ENV_VAR); env && *env) {
        std::filesystem::path p(env);
        if (!std::filesystem::exists(p, ec)) throw ConfigError(std::string(ENV_VAR) + " points to a missing file: " + p.string());
        return p;
    }

    if (std::filesystem::exists(SYSTEM_PATH, ec)) return std::filesystem::path(SYSTEM_PATH);
    return std::nullopt;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

Config& ConfigRegistry::mutate() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace tmr::config
