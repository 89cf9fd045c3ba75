#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace tmr::config {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class ConfigRegistry {
public:
    // Loads the file at path, or the first file found by resolvePath() when empty.
    // Falls back to built-in defaults when nothing is found.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);

    // Installs an already-built config (tests, embedding).
    static void init(const Config& config);

    static const Config& get();
    static Config& mutate();

    [[nodiscard]] static bool isInitialized();

    // --config, then $TREEMIRROR_CONFIG, then /etc/treemirror/config.yaml
    static std::optional<std::filesystem::path> resolvePath();

    static constexpr const auto* ENV_VAR = "TREEMIRROR_CONFIG";
    static constexpr const auto* SYSTEM_PATH = "/etc/treemirror/config.yaml";

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace tmr::config
