#pragma once

#include <filesystem>

namespace sw::paths {

// $XDG_CONFIG_HOME/savewarp/config.yaml, falling back to ~/.config/savewarp/config.yaml.
// Empty when neither variable is set.
std::filesystem::path getConfigPath();

}
