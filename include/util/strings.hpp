#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace sw::util {

inline std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool iequals(const std::string_view a, const std::string_view b) {
    return a.size() == b.size() && std::ranges::equal(a, b, [](const unsigned char x, const unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

inline std::string trim(const std::string_view s, const std::string_view chars = " \t") {
    const auto b = s.find_first_not_of(chars);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(chars);
    return std::string(s.substr(b, e - b + 1));
}

inline bool isHex(const std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) { return std::isxdigit(c) != 0; });
}

// "Perfect Dark (USA) [!]" -> "Perfect Dark". Drops every (...) and [...] group and
// collapses the whitespace left behind.
inline std::string stripTags(const std::string_view name) {
    std::string out;
    out.reserve(name.size());
    int depth = 0;
    for (const char c : name) {
        if (c == '(' || c == '[') { ++depth; continue; }
        if ((c == ')' || c == ']') && depth > 0) { --depth; continue; }
        if (depth > 0) continue;
        if (c == ' ' && (out.empty() || out.back() == ' ')) continue;
        out.push_back(c);
    }
    return trim(out);
}

}
