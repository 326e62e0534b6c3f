#include "save/Locator.hpp"
#include "save/Registry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

using namespace sw::save;
using namespace sw::logging;
namespace fs = std::filesystem;

Locator::Locator(const SaveFormat format, fs::path baseDir)
    : format_(Registry::get(format)), baseDir_(std::move(baseDir)) {}

std::optional<Locator::GameDir> Locator::findSubfolder(const SubfolderPattern& pattern) const {
    std::vector<GameDir> matches;

    std::error_code ec;
    for (fs::directory_iterator it(baseDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (!it->is_directory(typeEc)) continue;
        const auto name = it->path().filename().string();
        if (auto title = pattern.match(name)) matches.push_back({it->path(), std::move(*title)});
    }

    if (ec) LogRegistry::save()->warn("[Locator] Cannot list {}: {}", baseDir_.string(), ec.message());
    if (matches.empty()) return std::nullopt;

    std::ranges::sort(matches, {}, &GameDir::dir);
    if (matches.size() > 1)
        LogRegistry::save()->warn("[Locator] {} folders match '{}' in {}, using {}",
                                  matches.size(), pattern.title, baseDir_.string(),
                                  matches.front().dir.filename().string());
    return matches.front();
}

std::optional<Locator::GameDir> Locator::gameDir(const std::string& canonicalName,
                                                 const std::optional<std::string>& internalName) const {
    const auto rule = format_.subfolderRule(canonicalName);
    if (!rule) return GameDir{baseDir_, canonicalName};

    if (auto dir = findSubfolder(*rule)) return dir;

    if (internalName && !internalName->empty()) {
        if (auto dir = findSubfolder(SubfolderPattern{*internalName})) return dir;
    }

    LogRegistry::save()->debug("[Locator] No {} folder for '{}' in {}",
                               to_string(format_.id()), canonicalName, baseDir_.string());
    return std::nullopt;
}

SaveEntries Locator::locate(const std::string& canonicalName, const std::optional<std::string>& internalName) const {
    SaveEntries entries;
    const auto dir = gameDir(canonicalName, internalName);

    for (const auto& kind : SaveKind::all()) {
        SavePathEntry entry{canonicalName, kind, std::nullopt, false, std::nullopt};

        if (dir) {
            if (const auto name = format_.fileName(dir->basename, kind)) {
                entry.path = dir->dir / *name;
                entry.modified = util::modifiedTime(*entry.path);
                entry.exists = entry.modified.has_value();
            }
        }

        entries.emplace(kind, std::move(entry));
    }

    return entries;
}

SaveEntries sw::save::locate(const std::string& canonicalName, const SaveFormat format, const fs::path& baseDir) {
    return Locator(format, baseDir).locate(canonicalName);
}
