#pragma once

#include "save/Kind.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sw::save {

enum class SaveFormat : uint8_t { Project64, Mupen64Plus, Everdrive };

// project64, mupen64plus, everdrive
std::string to_string(SaveFormat format);

// Case-insensitive inverse of to_string(). Throws std::invalid_argument.
SaveFormat parseSaveFormat(std::string_view str);

// Matches per-game folders named "<TITLE>-<ID>" where ID is an opaque run of hex
// digits written by the emulator. The ID is never computed, only recognised.
struct SubfolderPattern {
    std::string title;

    // Title part of `dirName` as spelled on disk, if `dirName` matches.
    [[nodiscard]] std::optional<std::string> match(std::string_view dirName) const;
};

// Naming and layout rules of one save-storage convention. Pure, no I/O.
struct Format {
    virtual ~Format() = default;

    [[nodiscard]] virtual SaveFormat id() const = 0;

    // nullopt for flat layouts.
    [[nodiscard]] virtual std::optional<SubfolderPattern> subfolderRule(const std::string& canonicalName) const = 0;

    // nullopt when the format keeps no file for this kind.
    [[nodiscard]] virtual std::optional<std::string> extensionFor(const SaveKind& kind) const = 0;

    // Inserted between basename and extension. Empty for slot 1 unless a format says otherwise.
    [[nodiscard]] virtual std::string controllerPakSuffix(uint8_t slot) const;

    [[nodiscard]] std::optional<std::string> fileName(const std::string& basename, const SaveKind& kind) const;

    [[nodiscard]] bool usesSubfolder() const { return subfolderRule("").has_value(); }
};

}
