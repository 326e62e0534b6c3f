#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>

namespace sw::config {

class ConfigRegistry {
public:
    // Loads `path` when given (must exist), otherwise the default location if a file
    // is there, otherwise built-in defaults.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);

    // Replaces the active config without touching disk.
    static void set(Config cfg);

    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

    // Where the active config came from; empty for built-in defaults.
    static const std::filesystem::path& source() { return source_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline std::filesystem::path source_;
    static inline bool initialized_ = false;
};

}
