#include "config/paths.hpp"

#include <cstdlib>

namespace sw::paths {

std::filesystem::path getConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "savewarp" / "config.yaml";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "savewarp" / "config.yaml";
    return {};
}

}
