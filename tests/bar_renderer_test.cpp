#include <gtest/gtest.h>
#include "termbar/progress/bar_renderer.hpp"
#include "termbar/common/constants.hpp"
#include <string>

using termbar::progress::BarRenderer;
using termbar::progress::fixedTerminalWidth;
using termbar::progress::queryTerminalWidth;

namespace {

const std::string CLEAR = termbar::constants::terminal::CLEAR_LINE;

BarRenderer plainRenderer(int width) {
    return BarRenderer(fixedTerminalWidth(width), false, "Termio");
}

}

TEST(BarRenderer, digit_count) {
    EXPECT_EQ(1, BarRenderer::digitCount(0));
    EXPECT_EQ(1, BarRenderer::digitCount(-7));
    EXPECT_EQ(1, BarRenderer::digitCount(9));
    EXPECT_EQ(2, BarRenderer::digitCount(10));
    EXPECT_EQ(3, BarRenderer::digitCount(999));
    EXPECT_EQ(4, BarRenderer::digitCount(1000));
}

TEST(BarRenderer, percent_text_has_fixed_width) {
    EXPECT_EQ("  0.00%", BarRenderer::formatPercent(0.0));
    EXPECT_EQ(" 25.00%", BarRenderer::formatPercent(0.25));
    EXPECT_EQ("100.00%", BarRenderer::formatPercent(1.0));
}

TEST(BarRenderer, counts_are_padded_to_total_digits) {
    EXPECT_EQ("    5 / 1000 ", BarRenderer::formatCounts(5, 1000, false));
    EXPECT_EQ("  50 / 100 ", BarRenderer::formatCounts(50, 100, false));
    EXPECT_EQ(" 0 / 0 ", BarRenderer::formatCounts(0, 0, false));
}

TEST(BarRenderer, byte_counts_use_units) {
    EXPECT_EQ("  1.0 MB /  2.0 MB ", BarRenderer::formatCounts(1000000, 2000000, true));
    EXPECT_EQ("     0 B /  2.0 MB ", BarRenderer::formatCounts(0, 2000000, true));
}

TEST(BarRenderer, fill_spells_the_word) {
    auto renderer = plainRenderer(80);
    EXPECT_EQ("To", renderer.renderFill(2));
    EXPECT_EQ("Tio", renderer.renderFill(3));
    EXPECT_EQ("Tmio", renderer.renderFill(4));
    EXPECT_EQ("Trmio", renderer.renderFill(5));
    EXPECT_EQ("Termio", renderer.renderFill(6));
    EXPECT_EQ("Teeermio", renderer.renderFill(8));
}

TEST(BarRenderer, fill_width_has_a_floor_of_two) {
    EXPECT_EQ(2, BarRenderer::fillWidth(57, 0.0));
    EXPECT_EQ(29, BarRenderer::fillWidth(57, 0.5));
    EXPECT_EQ(57, BarRenderer::fillWidth(57, 1.0));
}

TEST(BarRenderer, unsupported_word_falls_back_to_default) {
    BarRenderer renderer(fixedTerminalWidth(80), false, "Go");
    EXPECT_EQ(termbar::constants::progress::DEFAULT_WORD, renderer.word());
}

TEST(BarRenderer, colored_fill_uses_ansi_sequences) {
    BarRenderer renderer(fixedTerminalWidth(80), true, "Termio");
    std::string fill = renderer.renderFill(8);
    EXPECT_NE(std::string::npos, fill.find("\x1b[31m"));
    EXPECT_NE(std::string::npos, fill.find("\x1b[32meee"));
    EXPECT_NE(std::string::npos, fill.find("\x1b[0m"));
}

TEST(BarRenderer, half_way_frame_on_80_columns) {
    auto renderer = plainRenderer(80);
    
    std::string expected = CLEAR + "  50 / 100 [T" + std::string(24, 'e') + "rmio" +
                           std::string(28, ' ') + "]  50.00% ";
    EXPECT_EQ(expected, renderer.renderFrame(50, 100, false));
}

TEST(BarRenderer, complete_frame_has_no_padding) {
    auto renderer = plainRenderer(80);
    std::string frame = renderer.renderFrame(10, 10, false);
    
    EXPECT_EQ(0u, frame.find(CLEAR));
    EXPECT_NE(std::string::npos, frame.find("o] 100.00% "));
    // 80 columns: 9 for counts, 59 for the bar, 2 brackets, 1 space, 7 + 1 for the percentage
    EXPECT_EQ(79u, frame.size() - CLEAR.size());
}

TEST(BarRenderer, narrow_terminal_skips_the_bar) {
    // 28 columns leave 5 for the bar
    auto renderer = plainRenderer(28);
    std::string frame = renderer.renderFrame(50, 100, false);
    
    EXPECT_EQ(CLEAR + "  50 / 100 " + " 50.00% ", frame);
    EXPECT_EQ(std::string::npos, frame.find('['));
}

TEST(BarRenderer, minimum_bar_space_draws_the_bar) {
    // 34 columns leave exactly 11 for the bar
    auto renderer = plainRenderer(34);
    std::string frame = renderer.renderFrame(50, 100, false);
    
    EXPECT_EQ(CLEAR + "  50 / 100 [Termio     ]  50.00% ", frame);
}

TEST(BarRenderer, unknown_width_behaves_like_80_columns) {
    auto fallback = plainRenderer(-1);
    auto zero = plainRenderer(0);
    auto standard = plainRenderer(80);
    
    EXPECT_EQ(80, fallback.terminalWidth());
    EXPECT_EQ(80, zero.terminalWidth());
    EXPECT_EQ(standard.renderFrame(42, 100, false), fallback.renderFrame(42, 100, false));
}

TEST(BarRenderer, terminal_query_on_invalid_descriptor_reports_unknown) {
    EXPECT_EQ(-1, queryTerminalWidth(-1));
    
    BarRenderer renderer([] { return queryTerminalWidth(-1); }, false, "Termio");
    EXPECT_EQ(80, renderer.terminalWidth());
}

TEST(BarRenderer, byte_mode_frame_shows_megabytes) {
    auto renderer = plainRenderer(80);
    std::string frame = renderer.renderFrame(1000000, 2000000, true);
    
    EXPECT_NE(std::string::npos, frame.find("2.0 MB"));
    EXPECT_EQ(std::string::npos, frame.find("2000000"));
    EXPECT_NE(std::string::npos, frame.find(" 50.00%"));
}

TEST(BarRenderer, degenerate_total_renders_complete) {
    auto renderer = plainRenderer(80);
    std::string frame = renderer.renderFrame(0, 0, false);
    EXPECT_NE(std::string::npos, frame.find("100.00%"));
}
