#pragma once

#include "save/Format.hpp"

namespace sw::save::formats {

// Project64: one "<INTERNAL NAME>-<ROM HASH>" folder per game under the save root,
// files inside named after the internal name. Every controller pak carries a
// _Cont_<n> suffix, including slot 1.
struct Project64 final : Format {
    [[nodiscard]] SaveFormat id() const override { return SaveFormat::Project64; }
    [[nodiscard]] std::optional<SubfolderPattern> subfolderRule(const std::string& canonicalName) const override;
    [[nodiscard]] std::optional<std::string> extensionFor(const SaveKind& kind) const override;
    [[nodiscard]] std::string controllerPakSuffix(uint8_t slot) const override;
};

}
