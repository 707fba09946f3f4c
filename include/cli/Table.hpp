#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace trashy::cli {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool ellipsize_middle = false;   // clamp with "..." in the middle (paths)
};

class Table {
public:
    explicit Table(std::vector<Column> cols, int term_width = 0)
        : cols_(std::move(cols)), term_width_(term_width) {}

    void add_row(std::vector<std::string> cells) { rows_.push_back(std::move(cells)); }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const std::size_t ncol = cols_.size();
        std::vector<std::size_t> width(ncol, 0);
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::max(cols_[i].min, cols_[i].header.size());
        for (const auto& r : rows_)
            for (std::size_t i = 0; i < ncol && i < r.size(); ++i)
                width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));

        constexpr std::size_t gap = 2;
        const auto total_width = [&] {
            std::size_t sum = gap * (ncol - 1);
            for (const auto w : width) sum += w;
            return sum;
        };

        // The last column soaks up any shrinking needed to fit the terminal
        constexpr int fallback_term = 100;
        const auto tw = static_cast<std::size_t>(term_width_ > 0 ? term_width_ : fallback_term);
        const std::size_t flex = ncol - 1;
        while (total_width() > tw && width[flex] > cols_[flex].min) --width[flex];

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        std::vector<std::string> header;
        header.reserve(ncol);
        for (const auto& c : cols_) header.push_back(c.header);
        emit_row(out, header, width);

        for (std::size_t i = 0; i < ncol; ++i) {
            if (i) out += std::string(gap, ' ');
            out += std::string(width[i], '-');
        }
        out += '\n';

        for (const auto& r : rows_) emit_row(out, r, width);
        return out;
    }

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    int term_width_ = 0;

    void emit_row(std::string& out, const std::vector<std::string>& cells, const std::vector<std::size_t>& width) const {
        std::string line;
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) line += "  ";
            std::string s = i < cells.size() ? cells[i] : "";
            if (s.size() > width[i]) s = cols_[i].ellipsize_middle ? ellipsize_middle(s, width[i]) : s.substr(0, width[i]);
            if (cols_[i].align == Align::Left)
                fmt::format_to(std::back_inserter(line), "{:<{}}", s, width[i]);
            else
                fmt::format_to(std::back_inserter(line), "{:>{}}", s, width[i]);
        }
        while (!line.empty() && line.back() == ' ') line.pop_back();
        out += line;
        out += '\n';
    }

    static std::string ellipsize_middle(const std::string& s, const std::size_t width) {
        if (s.size() <= width) return s;
        if (width <= 3) return s.substr(0, width);
        const std::size_t keep = width - 3;
        const std::size_t left = keep / 2;
        const std::size_t right = keep - left;
        return s.substr(0, left) + "..." + s.substr(s.size() - right);
    }
};

}
