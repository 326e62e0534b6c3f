#pragma once

#include <filesystem>
#include <optional>

namespace sw::util {

// Last-write time, or nullopt when `path` is not a regular file.
std::optional<std::filesystem::file_time_type> modifiedTime(const std::filesystem::path& path);

// Byte copy of `src` over `dst` (parents created), then `dst` takes the mtime of `src`
// so later newer-than comparisons stay meaningful. Throws CopyFailed.
void copyWithMetadata(const std::filesystem::path& src, const std::filesystem::path& dst);

// Copies `file` into `backupDir` under the same filename, replacing an older backup.
// Returns the backup path. Throws CopyFailed.
std::filesystem::path backupFile(const std::filesystem::path& file, const std::filesystem::path& backupDir);

}
