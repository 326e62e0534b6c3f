#include "save/Format.hpp"
#include "util/strings.hpp"

#include <stdexcept>

namespace sw::save {

std::string to_string(const SaveFormat format) {
    switch (format) {
        case SaveFormat::Project64: return "project64";
        case SaveFormat::Mupen64Plus: return "mupen64plus";
        case SaveFormat::Everdrive: return "everdrive";
    }
    throw std::logic_error("Unknown save format");
}

SaveFormat parseSaveFormat(const std::string_view str) {
    const auto s = util::toLower(std::string(str));
    if (s == "project64") return SaveFormat::Project64;
    if (s == "mupen64plus") return SaveFormat::Mupen64Plus;
    if (s == "everdrive") return SaveFormat::Everdrive;
    throw std::invalid_argument("Unknown save format: " + std::string(str));
}

std::optional<std::string> SubfolderPattern::match(const std::string_view dirName) const {
    if (title.empty() || dirName.size() < title.size() + 2) return std::nullopt;
    if (dirName[title.size()] != '-') return std::nullopt;

    const auto head = dirName.substr(0, title.size());
    if (!util::iequals(head, title)) return std::nullopt;
    if (!util::isHex(dirName.substr(title.size() + 1))) return std::nullopt;

    return std::string(head);
}

std::string Format::controllerPakSuffix(const uint8_t slot) const {
    if (slot <= 1) return {};
    return "_Cont_" + std::to_string(slot);
}

std::optional<std::string> Format::fileName(const std::string& basename, const SaveKind& kind) const {
    const auto ext = extensionFor(kind);
    if (!ext) return std::nullopt;
    if (kind.isControllerPak()) return basename + controllerPakSuffix(kind.slot) + *ext;
    return basename + *ext;
}

}
