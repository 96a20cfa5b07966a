#include "termbar/progress/bar_renderer.hpp"
#include "termbar/progress/counter_state.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/format/bytes.hpp"
#include <fmt/format.h>
#include <fmt/color.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <sys/ioctl.h>
#include <unistd.h>

namespace termbar {
namespace progress {

namespace {

constexpr std::array<fmt::terminal_color, constants::progress::WORD_LENGTH> LETTER_COLORS = {
    fmt::terminal_color::red,
    fmt::terminal_color::green,
    fmt::terminal_color::yellow,
    fmt::terminal_color::magenta,
    fmt::terminal_color::cyan,
    fmt::terminal_color::cyan
};

int nonNegative(int value) {
    return value >= 0 ? value : 0;
}

int atMostOne(int value) {
    return nonNegative(std::min(1, value));
}

}

int queryTerminalWidth(int fd) {
    struct winsize w;
    if (ioctl(fd, TIOCGWINSZ, &w) == 0) {
        return w.ws_col;
    }
    return -1;
}

TerminalWidth stdinTerminalWidth() {
    return [] { return queryTerminalWidth(STDIN_FILENO); };
}

TerminalWidth fixedTerminalWidth(int columns) {
    return [columns] { return columns; };
}

BarRenderer::BarRenderer(TerminalWidth width_query, bool use_colors, const std::string& word)
    : width_query_(width_query ? std::move(width_query) : stdinTerminalWidth()),
      use_colors_(use_colors),
      word_(word.size() == constants::progress::WORD_LENGTH ? word : constants::progress::DEFAULT_WORD) {
}

int BarRenderer::terminalWidth() const {
    int width = width_query_();
    if (width <= 0) {
        return constants::terminal::DEFAULT_WIDTH;
    }
    return width;
}

std::string BarRenderer::formatPercent(double pct) {
    return fmt::format("{:>{}}", fmt::format("{:.2f}%", pct * 100),
                       constants::progress::PERCENT_WIDTH);
}

int BarRenderer::digitCount(int64_t value) {
    if (value < 1) {
        return 1;
    }
    int digits = 0;
    while (value > 0) {
        value /= 10;
        ++digits;
    }
    return digits;
}

std::string BarRenderer::formatCounts(int64_t current, int64_t total, bool bytes) {
    if (bytes) {
        std::string cur_str = format::formatBytes(static_cast<uint64_t>(std::max<int64_t>(0, current)));
        std::string max_str = format::formatBytes(static_cast<uint64_t>(std::max<int64_t>(0, total)));
        size_t width = std::max(cur_str.size(), max_str.size()) + 1;
        return fmt::format(" {:>{}} / {:>{}} ", cur_str, width, max_str, width);
    }
    
    int digits = digitCount(total);
    return fmt::format(" {:>{}} / {:>{}} ", current, digits, total, digits);
}

int BarRenderer::barSpace(int term_width, const std::string& counts, const std::string& pct) {
    return term_width - static_cast<int>(counts.size()) - static_cast<int>(pct.size()) -
           constants::progress::DECORATION_WIDTH;
}

int BarRenderer::fillWidth(int space, double pct) {
    int fill = static_cast<int>(std::floor(static_cast<double>(space) * pct + 0.5));
    return std::max(constants::progress::MIN_FILL, fill);
}

std::string BarRenderer::colorize(size_t letter, int count) const {
    if (count <= 0) {
        return "";
    }
    std::string run(static_cast<size_t>(count), word_[letter]);
    if (!use_colors_) {
        return run;
    }
    return fmt::format(fmt::fg(LETTER_COLORS[letter]), "{}", run);
}

// The first letter is always drawn, the second stretches over the slack and
// the remaining four appear one by one as the fill grows. The runs always
// add up to exactly `fill` columns.
std::string BarRenderer::renderFill(int fill) const {
    std::string out;
    out += colorize(0, 1);
    out += colorize(1, nonNegative(fill - 5));
    out += colorize(2, atMostOne(fill - 4));
    out += colorize(3, atMostOne(fill - 3));
    out += colorize(4, atMostOne(fill - 2));
    out += colorize(5, atMostOne(fill - 1));
    return out;
}

std::string BarRenderer::renderFrame(int64_t current, int64_t total, bool bytes) const {
    double pct = computePercent(current, total);
    std::string pct_str = formatPercent(pct);
    std::string counts = formatCounts(current, total, bytes);
    
    int space = barSpace(terminalWidth(), counts, pct_str);
    
    std::string frame = constants::terminal::CLEAR_LINE;
    frame += counts;
    
    if (space < constants::progress::MIN_BAR_SPACE) {
        frame += pct_str;
        frame += " ";
        return frame;
    }
    
    int fill = std::min(fillWidth(space, pct), space);
    
    frame += "[";
    frame += renderFill(fill);
    frame.append(static_cast<size_t>(nonNegative(space - fill)), ' ');
    frame += "] ";
    frame += pct_str;
    frame += " ";
    return frame;
}

}}
