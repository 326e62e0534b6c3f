#include "shell/Args.hpp"

#include <algorithm>

using namespace sw::shell;

std::vector<std::string> sw::shell::normalizeArgs(const int argc, const char* const* argv) {
    std::vector<std::string> out;
    out.reserve(argc > 1 ? static_cast<size_t>(argc) + 4 : 4);
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";

        if (a.rfind("--", 0) == 0 && a.size() > 2) {
            if (const auto eq = a.find('='); eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));   // --key
                out.emplace_back(a.substr(eq + 1));  // value
                continue;
            }
        }

        out.emplace_back(std::move(a));
    }
    return out;
}

static bool isFlagToken(const std::string& s) {
    return s.size() > 1 && s[0] == '-' && s != "--";
}

static std::string stripDashes(const std::string& s) {
    const auto p = s.find_first_not_of('-');
    return p == std::string::npos ? std::string{} : s.substr(p);
}

void sw::shell::setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

CommandCall sw::shell::parseArgs(const std::vector<std::string>& args,
                                 const std::unordered_set<std::string>& bareFlags) {
    CommandCall call;
    call.options.reserve(8);

    bool stop_flags = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& t = args[i];

        if (!stop_flags && t == "--") { stop_flags = true; continue; }

        if (!stop_flags && isFlagToken(t)) {
            const auto key = stripDashes(t);
            if (!bareFlags.contains(key) && i + 1 < args.size() && !isFlagToken(args[i + 1]) && args[i + 1] != "--") {
                setOpt(call, key, args[i + 1]);
                ++i;
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t);
    }

    return call;
}

std::optional<std::string> sw::shell::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool sw::shell::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool sw::shell::hasKey(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&key](const auto& kv) { return kv.key == key; });
}

CommandResult sw::shell::invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult sw::shell::ok(std::string out) { return {0, std::move(out), ""}; }
