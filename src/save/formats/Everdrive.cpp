#include "save/formats/Everdrive.hpp"

using namespace sw::save;
using namespace sw::save::formats;

std::optional<std::string> Everdrive::extensionFor(const SaveKind& kind) const {
    switch (kind.type) {
        case SaveKind::Type::Sram: return ".srm";
        case SaveKind::Type::Eeprom: return ".eep";
        case SaveKind::Type::FlashRam: return ".fla";
        case SaveKind::Type::ControllerPak: return ".mpk";
    }
    return std::nullopt;
}
