#include "rom/Catalog.hpp"
#include "rom/Header.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <algorithm>
#include <system_error>

using namespace sw::rom;
using namespace sw::logging;
namespace fs = std::filesystem;

const std::vector<std::string>& Catalog::defaultExtensions() {
    static const std::vector<std::string> exts = {".z64", ".n64", ".v64"};
    return exts;
}

Catalog::Catalog(const fs::path& romDir, const bool recursive, std::vector<std::string> extensions)
    : root_(romDir), extensions_(std::move(extensions)) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) throw DirectoryNotFound("ROM directory does not exist or is not a directory", root_);

    for (auto& ext : extensions_) {
        ext = util::toLower(ext);
        if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
    }

    if (recursive) it_ = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
    else it_ = fs::directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);

    if (ec) throw DirectoryNotFound("Cannot enumerate ROM directory (" + ec.message() + ")", root_);

    LogRegistry::rom()->debug("[Catalog] Scanning {}{}", root_.string(), recursive ? " recursively" : "");
}

bool Catalog::isRom(const fs::path& file) const {
    const auto ext = util::toLower(file.extension().string());
    return std::ranges::find(extensions_, ext) != extensions_.end();
}

std::optional<fs::directory_entry> Catalog::advance() {
    return std::visit([](auto& it) -> std::optional<fs::directory_entry> {
        using It = std::decay_t<decltype(it)>;
        if (it == It{}) return std::nullopt;
        fs::directory_entry entry = *it;
        std::error_code ec;
        it.increment(ec);
        if (ec) {
            LogRegistry::rom()->warn("[Catalog] Directory iteration stopped early: {}", ec.message());
            it = It{};
        }
        return entry;
    }, it_);
}

std::optional<RomEntry> Catalog::next() {
    while (auto entry = advance()) {
        std::error_code ec;
        if (!entry->is_regular_file(ec)) continue;

        const auto& path = entry->path();
        if (!isRom(path)) {
            LogRegistry::rom()->debug("[Catalog] Skipping non-ROM file {}", path.string());
            continue;
        }

        RomEntry rom{path.stem().string(), path, std::nullopt};
        if (const auto header = readHeader(path); header && !header->internalName.empty())
            rom.internalName = header->internalName;

        LogRegistry::rom()->debug("[Catalog] Found '{}'", rom.canonicalName);
        return rom;
    }
    return std::nullopt;
}

std::vector<RomEntry> Catalog::scan(const fs::path& romDir, const bool recursive) {
    Catalog catalog(romDir, recursive);
    std::vector<RomEntry> roms;
    while (auto rom = catalog.next()) roms.push_back(std::move(*rom));
    std::ranges::sort(roms, {}, &RomEntry::canonicalName);
    return roms;
}
