#include "save/formats/Mupen64Plus.hpp"

using namespace sw::save;
using namespace sw::save::formats;

std::optional<std::string> Mupen64Plus::extensionFor(const SaveKind& kind) const {
    if (kind.isControllerPak()) return std::nullopt;
    return ".srm";
}
