#pragma once

#include "shell/Args.hpp"
#include "sync/Options.hpp"

#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace sw::shell {

std::string usage();

// critical|error|warning|info|debug (plus spdlog's own spellings).
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s);

// Builds run options from config defaults and the parsed command line.
// Returns a usage error in `error` when a required option is missing or malformed.
struct OptionsParse {
    std::optional<sync::Options> options;
    std::string error;
};

OptionsParse buildOptions(const CommandCall& call);

// Runs one sync for an already parsed command line. Config and logging must be
// initialised. Exit codes: 0 completed, 1 run rejected, 2 usage error.
CommandResult runSync(const CommandCall& call);

// Whole program: parse argv, load config, set up logging, sync, print.
int run(int argc, const char* const* argv);

}
