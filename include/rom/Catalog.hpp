#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sw::rom {

struct RomEntry {
    std::string canonicalName;               // filename without extension, tags kept
    std::filesystem::path path;
    std::optional<std::string> internalName; // from the ROM header when readable
};

// Single pass over a ROM directory. Entries are produced on demand by next(); the
// scan is not restartable and does not observe files added while it runs.
class Catalog {
public:
    static const std::vector<std::string>& defaultExtensions();

    // Throws DirectoryNotFound when `romDir` is missing or not a directory.
    explicit Catalog(const std::filesystem::path& romDir,
                     bool recursive = false,
                     std::vector<std::string> extensions = defaultExtensions());

    std::optional<RomEntry> next();

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    // Case-insensitive check against the configured extension set.
    [[nodiscard]] bool isRom(const std::filesystem::path& file) const;

    // Drains the catalog into a list of entries sorted by canonical name.
    static std::vector<RomEntry> scan(const std::filesystem::path& romDir, bool recursive = false);

private:
    std::filesystem::path root_;
    std::vector<std::string> extensions_;
    std::variant<std::filesystem::directory_iterator, std::filesystem::recursive_directory_iterator> it_;

    std::optional<std::filesystem::directory_entry> advance();
};

}
