#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>

namespace sw::logging {

void LogRegistry::init(const std::optional<spdlog::level::level_enum> consoleOverride) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(consoleOverride.value_or(cnf.levels.console_log_level));
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (cnf.log_dir / "savewarp.log").string(), file_max_bytes_, file_max_files_);
        file_sink_->set_level(cnf.levels.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("savewarp", sub_levels.savewarp);
    makeLogger("rom",      sub_levels.rom);
    makeLogger("save",     sub_levels.save);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("fs",       sub_levels.fs);
    makeLogger("config",   sub_levels.config);
    makeLogger("shell",    sub_levels.shell);

    initialized_ = true;
    savewarp()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::setConsoleLevel(const spdlog::level::level_enum level) {
    if (console_sink_) console_sink_->set_level(level);
}

void LogRegistry::shutdown() {
    spdlog::drop_all();
    console_sink_.reset();
    file_sink_.reset();
    initialized_ = false;
}

}
