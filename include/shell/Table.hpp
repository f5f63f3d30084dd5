#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace lv::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
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
        for (auto const& r : rows_)
            for (std::size_t i = 0; i < ncol && i < r.size(); ++i)
                width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));

        // 2 leading spaces + "  " between cols; the last column shrinks to fit the terminal
        const std::size_t pad_left = 2;
        const std::size_t gap = 2;
        auto total_width = [&](const std::vector<std::size_t>& w) {
            std::size_t sum = pad_left + gap * (ncol - 1);
            for (auto x : w) sum += x;
            return sum;
        };

        constexpr int fallback_term = 100;
        const int tw = term_width_ > 0 ? term_width_ : fallback_term;
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::clamp(width[i], cols_[i].min, cols_[i].max);
        while (static_cast<int>(total_width(width)) > tw && width[ncol - 1] > cols_[ncol - 1].min) --width[ncol - 1];

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        auto emit = [&](const std::vector<std::string>& cells) {
            out += "  ";
            for (std::size_t i = 0; i < ncol; ++i) {
                if (i) out += std::string(gap, ' ');
                std::string cell = i < cells.size() ? cells[i] : "";
                if (cell.size() > width[i]) cell = ellipsize(cell, width[i]);
                if (cols_[i].align == Align::Left) fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
                else fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
            }
            while (!out.empty() && out.back() == ' ') out.pop_back();
            out += '\n';
        };

        std::vector<std::string> headers;
        for (const auto& c : cols_) headers.push_back(c.header);
        emit(headers);

        out += "  ";
        for (std::size_t i = 0; i < ncol; ++i) {
            if (i) out += std::string(gap, ' ');
            out += std::string(width[i], '-');
        }
        out += '\n';

        for (auto const& r : rows_) emit(r);
        return out;
    }

private:
    static std::string ellipsize(const std::string& s, std::size_t width) {
        if (width <= 3) return s.substr(0, width);
        return s.substr(0, width - 3) + "...";
    }

    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    int term_width_ = 0;
};

}
