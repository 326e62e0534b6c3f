#pragma once

#include "save/Format.hpp"
#include "save/Kind.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace sw::save {

struct SavePathEntry {
    std::string game;
    SaveKind kind;
    std::optional<std::filesystem::path> path; // unset: format keeps no such file, or game folder not found
    bool exists{false};
    std::optional<std::filesystem::file_time_type> modified;

    [[nodiscard]] bool resolved() const { return path.has_value(); }
};

using SaveEntries = std::map<SaveKind, SavePathEntry>;

class Locator {
public:
    Locator(SaveFormat format, std::filesystem::path baseDir);

    // One entry for every SaveKind. Missing files are reported, never raised.
    // `internalName` is a second title candidate for subfolder layouts.
    [[nodiscard]] SaveEntries locate(const std::string& canonicalName,
                                     const std::optional<std::string>& internalName = std::nullopt) const;

    // Folder under baseDir holding this game's saves and the basename used inside it.
    // nullopt when the layout is per-game and no folder matches.
    struct GameDir {
        std::filesystem::path dir;
        std::string basename;
    };

    [[nodiscard]] std::optional<GameDir> gameDir(const std::string& canonicalName,
                                                 const std::optional<std::string>& internalName = std::nullopt) const;

    [[nodiscard]] SaveFormat format() const { return format_.id(); }
    [[nodiscard]] const std::filesystem::path& baseDir() const { return baseDir_; }

private:
    const Format& format_;
    std::filesystem::path baseDir_;

    [[nodiscard]] std::optional<GameDir> findSubfolder(const SubfolderPattern& pattern) const;
};

SaveEntries locate(const std::string& canonicalName, SaveFormat format, const std::filesystem::path& baseDir);

}
