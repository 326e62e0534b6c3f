#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sw::shell {

struct FlagKV {
    std::string key;                  // without leading dashes
    std::optional<std::string> value; // nullopt for bare flags
};

struct CommandCall {
    std::string program;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;       // 0 = success
    std::string stdout_text;
    std::string stderr_text;
};

// Splits "--key=value" into two tokens; "-" and "--" prefixes are both accepted.
std::vector<std::string> normalizeArgs(int argc, const char* const* argv);

// Keys in `bareFlags` never consume the following token as their value. Everything
// after a lone "--" is positional. Repeated keys: last wins.
CommandCall parseArgs(const std::vector<std::string>& args,
                      const std::unordered_set<std::string>& bareFlags = {});

void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

}
