#include "shell/Cli.hpp"
#include "shell/Table.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "sync/Engine.hpp"
#include "util/errors.hpp"
#include "util/strings.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <fmt/core.h>

using namespace sw::shell;
using namespace sw::config;
using namespace sw::logging;
using namespace sw::sync;
using namespace sw::save;

namespace {

const std::unordered_set<std::string> BARE_FLAGS = {"recursive", "r", "force", "no-backup", "help", "h"};

constexpr std::array<std::string_view, 13> KNOWN_KEYS = {
    "rom-dir", "src-format", "src-dir", "dst-format", "dst-dir",
    "recursive", "r", "force", "no-backup", "config", "loglevel", "help", "h",
};

}

std::string sw::shell::usage() {
    return
        "Usage: savewarp --rom-dir <path> --src-format <format> --src-dir <path>\n"
        "                --dst-format <format> --dst-dir <path> [options]\n"
        "\n"
        "Copy Nintendo 64 save files between emulator and flash cart conventions.\n"
        "Saves are matched to the ROMs found in --rom-dir; a save is only copied over\n"
        "an existing one when it is newer, and the replaced file is kept in a backup\n"
        "folder under the destination.\n"
        "\n"
        "Formats: project64, mupen64plus, everdrive\n"
        "\n"
        "Options:\n"
        "  --rom-dir <path>       Directory of N64 ROMs (.z64, .n64, .v64)\n"
        "  --src-format <format>  Source directory's save format\n"
        "  --src-dir <path>       Source directory for saves\n"
        "  --dst-format <format>  Destination directory's save format\n"
        "  --dst-dir <path>       Destination directory for saves\n"
        "  -r, --recursive        Search the ROM directory recursively\n"
        "  --force                Copy even when the destination is newer\n"
        "  --no-backup            Do not back up files before overwriting them\n"
        "  --config <path>        Read settings from this YAML file\n"
        "  --loglevel <level>     critical, error, warning, info or debug (default: warning)\n"
        "  -h, --help             Show this help\n"
        "\n"
        "Example, Project64 saves to RetroArch (Mupen64Plus):\n"
        "  savewarp --rom-dir ~/roms/n64 --src-format project64 --src-dir ~/pj64/Save \\\n"
        "           --dst-format mupen64plus --dst-dir ~/.config/retroarch/saves\n";
}

std::optional<spdlog::level::level_enum> sw::shell::parseLogLevel(const std::string& s) {
    const auto l = util::toLower(s);
    if (l == "critical") return spdlog::level::critical;
    if (l == "error" || l == "err") return spdlog::level::err;
    if (l == "warning" || l == "warn") return spdlog::level::warn;
    if (l == "info") return spdlog::level::info;
    if (l == "debug") return spdlog::level::debug;
    if (l == "trace") return spdlog::level::trace;
    if (l == "off") return spdlog::level::off;
    return std::nullopt;
}

OptionsParse sw::shell::buildOptions(const CommandCall& call) {
    OptionsParse res;

    if (!call.positionals.empty()) {
        res.error = "Unexpected argument: " + call.positionals.front();
        return res;
    }

    for (const auto& [key, value] : call.options) {
        if (std::ranges::find(KNOWN_KEYS, key) == KNOWN_KEYS.end()) {
            res.error = "Unknown option: --" + key;
            return res;
        }
    }

    const auto required = [&](const std::string& key) -> std::optional<std::string> {
        const auto v = optVal(call, key);
        if (!v || v->empty()) {
            if (res.error.empty()) res.error = "Missing required option: --" + key;
            return std::nullopt;
        }
        return v;
    };

    const auto romDir = required("rom-dir");
    const auto srcFormat = required("src-format");
    const auto srcDir = required("src-dir");
    const auto dstFormat = required("dst-format");
    const auto dstDir = required("dst-dir");
    if (!res.error.empty()) return res;

    const auto& cfg = ConfigRegistry::get();

    Options opts;
    try {
        opts.srcFormat = parseSaveFormat(*srcFormat);
        opts.dstFormat = parseSaveFormat(*dstFormat);
    } catch (const std::invalid_argument& e) {
        res.error = std::string(e.what()) + " (expected project64, mupen64plus or everdrive)";
        return res;
    }

    opts.romDir = *romDir;
    opts.srcDir = *srcDir;
    opts.dstDir = *dstDir;
    opts.backup = cfg.sync.backup && !hasKey(call, "no-backup");
    opts.overwriteOnlyIfNewer = cfg.sync.overwrite_only_if_newer && !hasKey(call, "force");
    opts.recursive = cfg.sync.recursive || hasKey(call, "recursive") || hasKey(call, "r");
    opts.backupDirName = cfg.sync.backup_dir_name;
    opts.mtimeTolerance = std::chrono::milliseconds(cfg.sync.mtime_tolerance_ms);
    opts.romExtensions = cfg.roms.extensions;

    res.options = std::move(opts);
    return res;
}

CommandResult sw::shell::runSync(const CommandCall& call) {
    const auto parsed = buildOptions(call);
    if (!parsed.options) {
        LogRegistry::shell()->debug("[Cli] Rejected command line: {}", parsed.error);
        return invalid(parsed.error + "\n\n" + usage());
    }

    try {
        const auto report = sync::sync(*parsed.options);
        return ok(report.render(term_width()));
    } catch (const DirectoryNotFound& e) {
        LogRegistry::shell()->error("[Cli] {}", e.what());
        return {1, "", e.what()};
    } catch (const std::invalid_argument& e) {
        LogRegistry::shell()->error("[Cli] {}", e.what());
        return {1, "", e.what()};
    }
}

int sw::shell::run(const int argc, const char* const* argv) {
    const auto call = parseArgs(normalizeArgs(argc, argv), BARE_FLAGS);

    if (hasKey(call, "help") || hasKey(call, "h")) {
        fmt::print("{}", usage());
        return 0;
    }

    std::optional<spdlog::level::level_enum> level = spdlog::level::warn;
    if (const auto lvl = optVal(call, "loglevel")) {
        level = parseLogLevel(*lvl);
        if (!level) {
            fmt::print(stderr, "Invalid log level: {}\n\n{}", *lvl, usage());
            return 2;
        }
    }

    try {
        if (const auto path = optVal(call, "config")) ConfigRegistry::init(std::filesystem::path(*path));
        else ConfigRegistry::init();
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to load config: {}\n", e.what());
        return 1;
    }

    // The configured console level only applies when --loglevel is absent and a config file set one.
    if (!hasKey(call, "loglevel") && !ConfigRegistry::source().empty()) level = std::nullopt;

    if (LogRegistry::isInitialized()) LogRegistry::setConsoleLevel(level.value_or(ConfigRegistry::get().logging.levels.console_log_level));
    else LogRegistry::init(level);

    if (!ConfigRegistry::source().empty())
        LogRegistry::config()->info("[Cli] Loaded config from {}", ConfigRegistry::source().string());

    const auto result = runSync(call);
    if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
    if (!result.stderr_text.empty()) {
        fmt::print(stderr, "{}", result.stderr_text);
        if (result.stderr_text.back() != '\n') fmt::print(stderr, "\n");
    }
    return result.exit_code;
}
