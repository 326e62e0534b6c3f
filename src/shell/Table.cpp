#include "shell/Table.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <sys/ioctl.h>
#include <unistd.h>
#include <fmt/format.h>

using namespace sw::shell;

int sw::shell::term_width() {
    if (!isatty(STDOUT_FILENO)) return 0;
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
    if (const char* c = std::getenv("COLUMNS")) { if (const int n = std::atoi(c); n > 0) return n; }
    return 0;
}

std::string Table::clamp(const std::string& s, const std::size_t width, const bool middle) {
    if (s.size() <= width) return s;
    if (!middle || width < 5) return s.substr(0, width);
    const std::size_t keep = (width - 3) / 2;
    const std::size_t tail = width - 3 - keep;
    return s.substr(0, keep) + "..." + s.substr(s.size() - tail);
}

std::string Table::render() const {
    if (cols_.empty()) return {};

    const std::size_t ncol = cols_.size();
    constexpr std::size_t pad_left = 2;
    constexpr std::size_t gap = 2;

    std::vector<std::size_t> width(ncol, 0);
    for (std::size_t i = 0; i < ncol; ++i) width[i] = std::max(cols_[i].min, cols_[i].header.size());
    for (const auto& r : rows_)
        for (std::size_t i = 0; i < ncol && i < r.size(); ++i)
            width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));

    if (term_width_ > 0) {
        auto total = pad_left + gap * (ncol - 1);
        for (const auto w : width) total += w;
        auto& flex = width.back();
        while (total > static_cast<std::size_t>(term_width_) && flex > cols_.back().min) { --flex; --total; }
    }

    std::string out;
    out.reserve(128 + rows_.size() * 96);

    const auto emitLine = [&](const auto& cellAt) {
        out.append(pad_left, ' ');
        for (std::size_t i = 0; i < ncol; ++i) {
            if (i) out.append(gap, ' ');
            const std::string cell = clamp(cellAt(i), width[i], cols_[i].ellipsize_middle);
            if (cols_[i].align == Align::Left) fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
            else fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
        }
        while (!out.empty() && out.back() == ' ') out.pop_back();
        out += '\n';
    };

    emitLine([&](const std::size_t i) { return cols_[i].header; });
    emitLine([&](const std::size_t i) { return std::string(width[i], '-'); });
    for (const auto& r : rows_)
        emitLine([&](const std::size_t i) { return i < r.size() ? r[i] : std::string{}; });

    return out;
}
