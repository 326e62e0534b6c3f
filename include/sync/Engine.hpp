#pragma once

#include "sync/Options.hpp"
#include "sync/Report.hpp"
#include "save/Locator.hpp"

#include <filesystem>

namespace sw::rom {
struct RomEntry;
}

namespace sw::sync {

class Engine {
public:
    explicit Engine(Options opts);

    // Processes every ROM in opts.romDir. Throws DirectoryNotFound when a root
    // directory is unusable, std::invalid_argument when source and destination are
    // the same directory. Per-file failures end up in the report.
    SyncReport run() const;

    [[nodiscard]] const Options& options() const { return opts_; }
    [[nodiscard]] std::filesystem::path backupDir() const { return opts_.dstDir / opts_.backupDirName; }

private:
    Options opts_;
    save::Locator src_;
    save::Locator dst_;

    void preflight() const;
    [[nodiscard]] GameReport syncGame(const rom::RomEntry& rom) const;
    [[nodiscard]] Outcome syncEntry(const save::SavePathEntry& src, const save::SavePathEntry& dst) const;
};

SyncReport sync(const Options& opts);

}
