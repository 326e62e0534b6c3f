#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sw {

// A root directory (ROMs, source saves, destination saves) is missing or unusable.
// Fatal for a run; raised before anything is copied.
struct DirectoryNotFound : std::runtime_error {
    std::filesystem::path path;

    DirectoryNotFound(const std::string& what, std::filesystem::path p)
        : std::runtime_error(what + ": " + p.string()), path(std::move(p)) {}
};

// A single copy or backup failed. Recovered per item by the sync engine.
struct CopyFailed : std::runtime_error {
    std::filesystem::path source;
    std::filesystem::path destination;

    CopyFailed(const std::string& what, std::filesystem::path src, std::filesystem::path dst)
        : std::runtime_error(what + " (" + src.string() + " -> " + dst.string() + ")"),
          source(std::move(src)), destination(std::move(dst)) {}
};

}
