#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tmr::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["max_concurrency"] = rhs.max_concurrency;
        node["digest_workers"] = rhs.digest_workers;
        node["scan_workers"] = rhs.scan_workers;
        node["copy_buffer_size"] = bytesToKbMbOrGbStr(rhs.copy_buffer_size);
        node["ignore_file"] = rhs.ignore_file;
        node["plan_sample_size"] = rhs.plan_sample_size;
        node["confirm_default"] = rhs.confirm_default;
        node["color"] = colorModeToString(rhs.color);
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_concurrency = node["max_concurrency"].as<unsigned int>(10);
        rhs.digest_workers = node["digest_workers"].as<unsigned int>(4);
        rhs.scan_workers = node["scan_workers"].as<unsigned int>(0);
        rhs.copy_buffer_size = parseKbMbOrGbToByte(node["copy_buffer_size"].as<std::string>("1MB"));
        rhs.ignore_file = node["ignore_file"].as<std::string>(".sync-ignore");
        rhs.plan_sample_size = node["plan_sample_size"].as<unsigned int>(20);
        rhs.confirm_default = node["confirm_default"].as<bool>(true);
        rhs.color = parseColorMode(node["color"].as<std::string>("auto"));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["treemirror"] = to_std_string(spdlog::level::to_string_view(rhs.treemirror));
        node["scan"]       = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["plan"]       = to_std_string(spdlog::level::to_string_view(rhs.plan));
        node["digest"]     = to_std_string(spdlog::level::to_string_view(rhs.digest));
        node["exec"]       = to_std_string(spdlog::level::to_string_view(rhs.exec));
        node["shell"]      = to_std_string(spdlog::level::to_string_view(rhs.shell));
        node["config"]     = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.treemirror = spdlog::level::from_str(node["treemirror"].as<std::string>("info"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("info"));
        rhs.plan = spdlog::level::from_str(node["plan"].as<std::string>("info"));
        rhs.digest = spdlog::level::from_str(node["digest"].as<std::string>("warn"));
        rhs.exec = spdlog::level::from_str(node["exec"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
