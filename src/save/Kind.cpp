#include "save/Kind.hpp"

#include <stdexcept>

namespace sw::save {

SaveKind SaveKind::controllerPak(const unsigned int slot) {
    if (slot < 1 || slot > MAX_CONTROLLER_PAKS)
        throw std::out_of_range("Controller pak slot must be 1-4, got " + std::to_string(slot));
    return {Type::ControllerPak, static_cast<uint8_t>(slot)};
}

const std::array<SaveKind, 7>& SaveKind::all() {
    static const std::array<SaveKind, 7> kinds = {
        sram(), eeprom(), flashRam(),
        controllerPak(1), controllerPak(2), controllerPak(3), controllerPak(4),
    };
    return kinds;
}

std::string to_string(const SaveKind& kind) {
    switch (kind.type) {
        case SaveKind::Type::Sram: return "sram";
        case SaveKind::Type::Eeprom: return "eeprom";
        case SaveKind::Type::FlashRam: return "flashram";
        case SaveKind::Type::ControllerPak: return "mpk" + std::to_string(kind.slot);
    }
    throw std::logic_error("Unknown save kind");
}

}
