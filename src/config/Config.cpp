#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sw::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping: " + path.string());

    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["roms"]) YAML::convert<RomConfig>::decode(node, cfg.roms);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string toYaml(const Config& cfg) {
    YAML::Node root;
    root["sync"] = cfg.sync;
    root["roms"] = cfg.roms;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
