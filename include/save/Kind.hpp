#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <string>

namespace sw::save {

struct SaveKind {
    enum class Type : uint8_t { Sram, Eeprom, FlashRam, ControllerPak };

    static constexpr uint8_t MAX_CONTROLLER_PAKS = 4;

    Type type{Type::Sram};
    uint8_t slot{0}; // 1..4 for ControllerPak, 0 otherwise

    static constexpr SaveKind sram() { return {Type::Sram, 0}; }
    static constexpr SaveKind eeprom() { return {Type::Eeprom, 0}; }
    static constexpr SaveKind flashRam() { return {Type::FlashRam, 0}; }

    // Throws std::out_of_range when slot is outside 1..4.
    static SaveKind controllerPak(unsigned int slot);

    // Sram, Eeprom, FlashRam, ControllerPak 1..4
    static const std::array<SaveKind, 7>& all();

    [[nodiscard]] bool isControllerPak() const { return type == Type::ControllerPak; }

    friend auto operator<=>(const SaveKind&, const SaveKind&) = default;
};

// sram, eeprom, flashram, mpk1..mpk4
std::string to_string(const SaveKind& kind);

}
