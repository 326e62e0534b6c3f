#pragma once

#include "save/Format.hpp"

namespace sw::save::formats {

// Mupen64Plus / RetroArch: flat directory, a single consolidated .srm per game.
// Controller paks live inside that file and are not copied slot by slot.
struct Mupen64Plus final : Format {
    [[nodiscard]] SaveFormat id() const override { return SaveFormat::Mupen64Plus; }
    [[nodiscard]] std::optional<SubfolderPattern> subfolderRule(const std::string&) const override { return std::nullopt; }
    [[nodiscard]] std::optional<std::string> extensionFor(const SaveKind& kind) const override;
};

}
