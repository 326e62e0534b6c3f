#include "sync/Engine.hpp"
#include "rom/Catalog.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <system_error>

using namespace sw::sync;
using namespace sw::save;
using namespace sw::rom;
using namespace sw::logging;
using namespace sw::util;
namespace fs = std::filesystem;

Engine::Engine(Options opts)
    : opts_(std::move(opts)),
      src_(opts_.srcFormat, opts_.srcDir),
      dst_(opts_.dstFormat, opts_.dstDir) {}

void Engine::preflight() const {
    std::error_code ec;
    if (!fs::is_directory(opts_.srcDir, ec)) throw DirectoryNotFound("Source save directory does not exist or is not a directory", opts_.srcDir);
    if (!fs::is_directory(opts_.dstDir, ec)) throw DirectoryNotFound("Destination save directory does not exist or is not a directory", opts_.dstDir);
    if (fs::equivalent(opts_.srcDir, opts_.dstDir, ec))
        throw std::invalid_argument("Source and destination save directories are the same: " + opts_.srcDir.string());

    const fs::path backupName(opts_.backupDirName);
    if (opts_.backupDirName.empty() || backupName.has_parent_path() || backupName == "." || backupName == "..")
        throw std::invalid_argument("Backup folder must be a plain folder name: '" + opts_.backupDirName + "'");
}

SyncReport Engine::run() const {
    preflight();

    SyncReport report;
    report.begin = std::chrono::system_clock::now();

    Catalog catalog(opts_.romDir, opts_.recursive, opts_.romExtensions);

    LogRegistry::sync()->info("[Engine] Syncing {} saves in {} to {} saves in {} for ROMs in {}",
                              to_string(src_.format()), src_.baseDir().string(),
                              to_string(dst_.format()), dst_.baseDir().string(), catalog.root().string());

    while (const auto rom = catalog.next()) report.games.push_back(syncGame(*rom));

    std::ranges::sort(report.games, {}, &GameReport::game);
    report.end = std::chrono::system_clock::now();

    LogRegistry::sync()->info("[Engine] Finished: {} game(s), {} copied, {} failed",
                              report.games.size(), report.copied(), report.failed());
    return report;
}

GameReport Engine::syncGame(const RomEntry& rom) const {
    GameReport game{rom.canonicalName, {}};
    game.outcomes.reserve(SaveKind::all().size());

    const auto srcEntries = src_.locate(rom.canonicalName, rom.internalName);
    const auto dstEntries = dst_.locate(rom.canonicalName, rom.internalName);

    // Formats that keep several kinds in one file must not copy it more than once.
    std::set<fs::path> usedSources, usedTargets;

    for (const auto& kind : SaveKind::all()) {
        const auto& s = srcEntries.at(kind);
        const auto& d = dstEntries.at(kind);

        Outcome o{kind};
        if (s.path) o.source = *s.path;
        if (d.path) o.destination = *d.path;

        if (!s.exists) {
            o.action = Action::SkippedNoSource;
        } else if (!d.resolved()) {
            o.action = Action::SkippedNoDestination;
            LogRegistry::sync()->warn("[Engine] '{}' {}: no {} location for this save",
                                      rom.canonicalName, to_string(kind), to_string(opts_.dstFormat));
        } else if (usedSources.contains(*s.path) || usedTargets.contains(*d.path)) {
            o.action = Action::SkippedSharedPath;
        } else {
            usedSources.insert(*s.path);
            usedTargets.insert(*d.path);
            o = syncEntry(s, d);
        }

        game.outcomes.push_back(std::move(o));
    }

    return game;
}

Outcome Engine::syncEntry(const SavePathEntry& src, const SavePathEntry& dst) const {
    Outcome o{src.kind, Action::Copied, *src.path, *dst.path, {}, {}};

    if (dst.exists && opts_.overwriteOnlyIfNewer && !(*src.modified > *dst.modified + opts_.mtimeTolerance)) {
        LogRegistry::sync()->debug("[Engine] {} is not newer than {}, skipping", src.path->string(), dst.path->string());
        o.action = Action::SkippedNotNewer;
        return o;
    }

    try {
        if (dst.exists && opts_.backup) {
            o.backup = backupFile(*dst.path, backupDir());
            o.action = Action::BackedUpAndCopied;
        }
        copyWithMetadata(*src.path, *dst.path);
        LogRegistry::sync()->info("[Engine] {} -> {}", src.path->string(), dst.path->string());
    } catch (const CopyFailed& e) {
        LogRegistry::sync()->error("[Engine] '{}' {}: {}", src.game, to_string(src.kind), e.what());
        o.action = Action::Failed;
        o.error = e.what();
    }

    return o;
}

SyncReport sw::sync::sync(const Options& opts) {
    return Engine(opts).run();
}
