#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace sw::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool ellipsize_middle = false; // clamp with "..." in the middle (paths)
};

// Fixed-width text table. The last column shrinks first when the terminal is narrow.
class Table {
public:
    explicit Table(std::vector<Column> cols, int term_width = 0)
        : cols_(std::move(cols)), term_width_(term_width) {}

    void add_row(std::vector<std::string> cells) { rows_.push_back(std::move(cells)); }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const;

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    int term_width_ = 0;

    static std::string clamp(const std::string& s, std::size_t width, bool middle);
};

int term_width();

}
