#include <text_metrics/text_metrics.hpp>
#include <gtest/gtest.h>

using namespace text_metrics;

TEST(TextMetrics, AsciiIsOneColumnPerChar) {
    EXPECT_EQ(display_width("Alice"), 5);
    EXPECT_EQ(display_width(""), 0);
}

TEST(TextMetrics, EastAsianWideIsTwoColumns) {
    EXPECT_EQ(char_width(U'日'), 2);
    EXPECT_EQ(display_width("日本"), 4);
    EXPECT_EQ(display_width("a日b"), 4);
}

TEST(TextMetrics, CombiningMarksAreZeroWidth) {
    EXPECT_EQ(char_width(0x0301), 0);
    EXPECT_EQ(display_width("e\xCC\x81"), 1);
}

TEST(TextMetrics, ControlCharactersAreZeroWidth) {
    EXPECT_EQ(char_width(U'\t'), 0);
    EXPECT_EQ(char_width(0x7F), 0);
}

TEST(TextMetrics, BoxDrawingIsNarrow) {
    EXPECT_EQ(char_width(U'─'), 1);
    EXPECT_EQ(char_width(U'┼'), 1);
}

TEST(TextMetrics, SplitLinesOnBreakMarkers) {
    const auto lines = split_lines("one<br>two<BR/>three<br />four");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "three");
    EXPECT_EQ(lines[3], "four");
}

TEST(TextMetrics, SplitLinesKeepsPlainText) {
    const auto lines = split_lines("a < b");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "a < b");
    EXPECT_EQ(split_lines("").size(), 1u);
}

TEST(TextMetrics, MultilineWidthIsWidestLine) {
    EXPECT_EQ(multiline_width("ab<br>abcd<br>a"), 4);
    EXPECT_EQ(line_count("ab<br>abcd<br>a"), 3);
    EXPECT_EQ(line_count("single"), 1);
}

TEST(TextMetrics, InvalidUtf8DecodesToReplacement) {
    const auto cps = decode_utf8("a\xFF" "b");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[1], char32_t{ 0xFFFD });
}

TEST(TextMetrics, AppendUtf8RoundTripsMultibyte) {
    std::string out;
    append_utf8(out, U'┼');
    EXPECT_EQ(out, "\xE2\x94\xBC");
}

TEST(TextMetrics, TruncateAddsEllipsis) {
    EXPECT_EQ(truncate_to_width("Alexander", 5), "Alex…");
    EXPECT_EQ(display_width(truncate_to_width("Alexander", 5)), 5);
    EXPECT_EQ(truncate_to_width("Bob", 5), "Bob");
    EXPECT_EQ(truncate_to_width("Bob", 0), "");
}

TEST(TextMetrics, TruncateNeverSplitsWideChars) {
    // 3 columns: one wide char plus the ellipsis; a second wide char would not fit.
    EXPECT_EQ(truncate_to_width("日本語", 4), "日…");
    EXPECT_EQ(truncate_to_width("日本語", 3), "日…");
}

TEST(TextMetrics, TruncateWorksPerLine) {
    EXPECT_EQ(truncate_to_width("abcdef<br>xy", 4), "abc…<br/>xy");
}
