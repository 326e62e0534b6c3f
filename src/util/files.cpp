#include "util/files.hpp"
#include "util/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <system_error>

using namespace sw::logging;
namespace fs = std::filesystem;

namespace sw::util {

std::optional<fs::file_time_type> modifiedTime(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    const auto t = fs::last_write_time(path, ec);
    if (ec) {
        LogRegistry::fs()->warn("[files] Cannot read mtime of {}: {}", path.string(), ec.message());
        return std::nullopt;
    }
    return t;
}

void copyWithMetadata(const fs::path& src, const fs::path& dst) {
    std::error_code ec;

    if (dst.has_parent_path()) {
        fs::create_directories(dst.parent_path(), ec);
        if (ec) throw CopyFailed("Failed to create destination directory: " + ec.message(), src, dst);
    }

    const auto mtime = fs::last_write_time(src, ec);
    if (ec) throw CopyFailed("Failed to stat source: " + ec.message(), src, dst);

    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) throw CopyFailed("Failed to copy: " + ec.message(), src, dst);

    fs::last_write_time(dst, mtime, ec);
    if (ec) throw CopyFailed("Failed to set modification time: " + ec.message(), src, dst);

    LogRegistry::fs()->debug("[files] Copied {} -> {}", src.string(), dst.string());
}

fs::path backupFile(const fs::path& file, const fs::path& backupDir) {
    const auto target = backupDir / file.filename();
    copyWithMetadata(file, target);
    LogRegistry::fs()->info("[files] Backed up {} to {}", file.string(), target.string());
    return target;
}

}
