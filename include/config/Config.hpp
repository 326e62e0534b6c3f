#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace sw::config {

struct SyncConfig {
    bool backup = true;
    bool overwrite_only_if_newer = true;
    bool recursive = false;
    std::string backup_dir_name = "backup";
    unsigned int mtime_tolerance_ms = 2000; // FAT keeps mtimes at 2 s resolution
};

struct RomConfig {
    std::vector<std::string> extensions = {".z64", ".n64", ".v64"};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum savewarp = spdlog::level::info;   // Run start/finish
    spdlog::level::level_enum rom      = spdlog::level::info;   // Catalog scanning, header parsing
    spdlog::level::level_enum save     = spdlog::level::info;   // Save lookup and subfolder matching
    spdlog::level::level_enum sync     = spdlog::level::info;   // Per-file decisions
    spdlog::level::level_enum fs       = spdlog::level::info;   // Copies and backups
    spdlog::level::level_enum config   = spdlog::level::info;
    spdlog::level::level_enum shell    = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    SyncConfig sync;
    RomConfig roms;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

std::string toYaml(const Config& cfg);

}
