#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace text_metrics {

// Terminal columns taken by one code point: 0 for controls and combining
// marks, 2 for East Asian wide/fullwidth, 1 otherwise.
int char_width(char32_t cp);

int display_width(std::string_view text);

// Splits on <br>, <br/> and <br /> (any case). Always returns at least one line.
std::vector<std::string> split_lines(std::string_view text);

int multiline_width(std::string_view text);
int line_count(std::string_view text);

// Invalid sequences decode to U+FFFD.
std::u32string decode_utf8(std::string_view text);
void append_utf8(std::string& out, char32_t cp);

// Cuts every line wider than max_width to max_width columns, the last of
// which becomes an ellipsis. max_width below 1 yields an empty string.
std::string truncate_to_width(std::string_view text, int max_width);

} // namespace text_metrics
