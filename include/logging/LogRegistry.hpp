#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace sw::logging {

class LogRegistry {
public:
    // Register every subsystem logger. Levels come from ConfigRegistry; a console
    // override (from --loglevel) replaces the configured console level.
    static void init(std::optional<spdlog::level::level_enum> consoleOverride = std::nullopt);

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> savewarp() { return get("savewarp"); }
    static std::shared_ptr<spdlog::logger> rom()      { return get("rom"); }
    static std::shared_ptr<spdlog::logger> save()     { return get("save"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> fs()       { return get("fs"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }
    static std::shared_ptr<spdlog::logger> shell()    { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

    static void setConsoleLevel(spdlog::level::level_enum level);

    // Drops all registered loggers; init() may be called again afterwards.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t file_max_bytes_ = 5 * 1024 * 1024; // 5 MiB
    static inline size_t file_max_files_ = 3;
};

}
