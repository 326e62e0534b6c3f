#pragma once

#include "config/Config.hpp"

#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

// from_str() maps unknown names to `off`; only an explicit "off" may mean that.
static spdlog::level::level_enum levelOr(const Node& parent, const std::string& key, const spdlog::level::level_enum def) {
    const auto node = parent[key];
    if (!node) return def;
    const auto name = node.as<std::string>();
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off")
        throw std::runtime_error("Invalid log level for '" + key + "': " + name);
    return lvl;
}

// A single directory name below the destination root.
static std::string backupDirNameOr(const Node& parent, const std::string& def) {
    const auto node = parent["backup_dir_name"];
    if (!node) return def;
    const auto name = node.as<std::string>();
    if (name.empty() || name == "." || name == ".." || name.find_first_of("/\\") != std::string::npos)
        throw std::runtime_error("Invalid backup_dir_name (must be a plain folder name): '" + name + "'");
    return name;
}

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["backup"] = rhs.backup;
        node["overwrite_only_if_newer"] = rhs.overwrite_only_if_newer;
        node["recursive"] = rhs.recursive;
        node["backup_dir_name"] = rhs.backup_dir_name;
        node["mtime_tolerance_ms"] = rhs.mtime_tolerance_ms;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backup = node["backup"].as<bool>(true);
        rhs.overwrite_only_if_newer = node["overwrite_only_if_newer"].as<bool>(true);
        rhs.recursive = node["recursive"].as<bool>(false);
        rhs.backup_dir_name = backupDirNameOr(node, "backup");
        rhs.mtime_tolerance_ms = node["mtime_tolerance_ms"].as<unsigned int>(2000);
        return true;
    }
};

template<>
struct convert<RomConfig> {
    static Node encode(const RomConfig& rhs) {
        Node node;
        node["extensions"] = rhs.extensions;
        return node;
    }

    static bool decode(const Node& node, RomConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["extensions"]) rhs.extensions = node["extensions"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["savewarp"] = to_std_string(spdlog::level::to_string_view(rhs.savewarp));
        node["rom"]      = to_std_string(spdlog::level::to_string_view(rhs.rom));
        node["save"]     = to_std_string(spdlog::level::to_string_view(rhs.save));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["fs"]       = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        node["shell"]    = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.savewarp = levelOr(node, "savewarp", spdlog::level::info);
        rhs.rom      = levelOr(node, "rom", spdlog::level::info);
        rhs.save     = levelOr(node, "save", spdlog::level::info);
        rhs.sync     = levelOr(node, "sync", spdlog::level::info);
        rhs.fs       = levelOr(node, "fs", spdlog::level::info);
        rhs.config   = levelOr(node, "config", spdlog::level::info);
        rhs.shell    = levelOr(node, "shell", spdlog::level::info);
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
        rhs.console_log_level = levelOr(node, "console_log_level", spdlog::level::warn);
        rhs.file_log_level = levelOr(node, "file_log_level", spdlog::level::info);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
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
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
