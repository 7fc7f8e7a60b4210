#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace diagram_loaders {

std::string_view trim(std::string_view s);

// Splits on '\n', dropping a trailing '\r' from each line.
std::vector<std::string_view> split_source_lines(std::string_view source);

bool is_skippable(std::string_view trimmed_line);

// True when `line` starts with `keyword` followed by whitespace or the end of the line.
bool starts_with_keyword(std::string_view line, std::string_view keyword);
bool starts_with_keyword_nocase(std::string_view line, std::string_view keyword);

std::string_view strip_statement_end(std::string_view line);

// Strips one pair of surrounding double quotes.
std::string_view unquote(std::string_view s);

// "unexpected `<line>`", with the line cut to 40 characters.
std::string unexpected(std::string_view line);

} // namespace diagram_loaders
