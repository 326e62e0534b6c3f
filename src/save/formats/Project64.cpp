#include "save/formats/Project64.hpp"
#include "util/strings.hpp"

using namespace sw::save;
using namespace sw::save::formats;

std::optional<SubfolderPattern> Project64::subfolderRule(const std::string& canonicalName) const {
    return SubfolderPattern{util::stripTags(canonicalName)};
}

std::optional<std::string> Project64::extensionFor(const SaveKind& kind) const {
    switch (kind.type) {
        case SaveKind::Type::Sram: return ".sra";
        case SaveKind::Type::Eeprom: return ".eep";
        case SaveKind::Type::FlashRam: return ".fla";
        case SaveKind::Type::ControllerPak: return ".mpk";
    }
    return std::nullopt;
}

std::string Project64::controllerPakSuffix(const uint8_t slot) const {
    return "_Cont_" + std::to_string(slot);
}
