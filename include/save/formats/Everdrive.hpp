#pragma once

#include "save/Format.hpp"

namespace sw::save::formats {

// EverDrive-64 SD card: flat directory, one file per save type, named after the ROM.
struct Everdrive final : Format {
    [[nodiscard]] SaveFormat id() const override { return SaveFormat::Everdrive; }
    [[nodiscard]] std::optional<SubfolderPattern> subfolderRule(const std::string&) const override { return std::nullopt; }
    [[nodiscard]] std::optional<std::string> extensionFor(const SaveKind& kind) const override;
};

}
