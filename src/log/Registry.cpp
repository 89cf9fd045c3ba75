#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <vector>

namespace tmr::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);
    sinks.push_back(console_sink_);

    if (!cnf.log_dir.empty()) {
        log_dir_ = cnf.log_dir;
        main_log_path_ = log_dir_ / "treemirror.log";

        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("treemirror", sub_levels.treemirror);
    makeLogger("scan",       sub_levels.scan);
    makeLogger("plan",       sub_levels.plan);
    makeLogger("digest",     sub_levels.digest);
    makeLogger("exec",       sub_levels.exec);
    makeLogger("shell",      sub_levels.shell);
    makeLogger("config",     sub_levels.config);

    initialized_ = true;
    treemirror()->debug("[log::Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::setConsoleLevel(const spdlog::level::level_enum level) {
    if (!initialized_) return;
    console_sink_->set_level(level);

    // Loggers filter before sinks do, so lower them too when asking for more detail
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > level) lg->set_level(level);
    });
}

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
