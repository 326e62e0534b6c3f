#pragma once

#include "save/Format.hpp"
#include "rom/Catalog.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sw::sync {

// Everything one run needs, passed explicitly so runs are independent of process state.
struct Options {
    std::filesystem::path romDir;
    save::SaveFormat srcFormat{save::SaveFormat::Project64};
    std::filesystem::path srcDir;
    save::SaveFormat dstFormat{save::SaveFormat::Everdrive};
    std::filesystem::path dstDir;

    bool backup = true;
    bool overwriteOnlyIfNewer = true;
    bool recursive = false;
    std::string backupDirName = "backup"; // single folder name under dstDir
    // Source must beat the destination by more than this to count as newer. FAT and
    // exFAT cards round stored mtimes, so an exact comparison never settles.
    std::chrono::milliseconds mtimeTolerance{2000};
    std::vector<std::string> romExtensions = rom::Catalog::defaultExtensions();
};

}
