#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"

#include <stdexcept>

namespace sw::config {

void ConfigRegistry::init(const std::optional<std::filesystem::path>& path) {
    namespace fs = std::filesystem;

    if (path) {
        if (!fs::is_regular_file(*path))
            throw std::runtime_error("Config file not found: " + path->string());
        config_ = loadConfig(*path);
        source_ = *path;
    } else if (const auto def = paths::getConfigPath(); !def.empty() && fs::is_regular_file(def)) {
        config_ = loadConfig(def);
        source_ = def;
    } else {
        config_ = Config{};
        source_.clear();
    }

    initialized_ = true;
}

void ConfigRegistry::set(Config cfg) {
    config_ = std::move(cfg);
    source_.clear();
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
