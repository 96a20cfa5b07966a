#pragma once

#include <string>
#include <cstdint>
#include <functional>

namespace termbar {
namespace progress {

// Returns the column count of the controlling terminal, or a value <= 0 when
// it cannot be determined.
using TerminalWidth = std::function<int()>;

int queryTerminalWidth(int fd);
TerminalWidth stdinTerminalWidth();
TerminalWidth fixedTerminalWidth(int columns);

class BarRenderer {
public:
    BarRenderer(TerminalWidth width_query, bool use_colors, const std::string& word);
    
    // Complete frame for one redraw, starting with the line-clear sequence.
    std::string renderFrame(int64_t current, int64_t total, bool bytes) const;
    
    std::string renderFill(int fill) const;
    int terminalWidth() const;
    
    const std::string& word() const { return word_; }
    
    static std::string formatPercent(double pct);
    static std::string formatCounts(int64_t current, int64_t total, bool bytes);
    static int digitCount(int64_t value);
    static int barSpace(int term_width, const std::string& counts, const std::string& pct);
    static int fillWidth(int space, double pct);

private:
    TerminalWidth width_query_;
    bool use_colors_;
    std::string word_;
    
    std::string colorize(size_t letter, int count) const;
};

}}
