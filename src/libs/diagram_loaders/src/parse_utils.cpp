#include "parse_utils.hpp"

#include <text_metrics/text_metrics.hpp>
#include <cctype>

namespace diagram_loaders {

namespace {

const std::size_t max_context_chars = 40;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // namespace

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split_source_lines(std::string_view source) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= source.size()) {
        std::size_t nl = source.find('\n', start);
        if (nl == std::string_view::npos) nl = source.size();
        std::string_view line = source.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = nl + 1;
    }
    return lines;
}

bool is_skippable(std::string_view trimmed_line) {
    return trimmed_line.empty() || trimmed_line.substr(0, 2) == "%%";
}

bool starts_with_keyword(std::string_view line, std::string_view keyword) {
    if (line.substr(0, keyword.size()) != keyword) return false;
    return line.size() == keyword.size() || is_space(line[keyword.size()]);
}

bool starts_with_keyword_nocase(std::string_view line, std::string_view keyword) {
    if (line.size() < keyword.size()) return false;
    for (std::size_t i = 0; i < keyword.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) != std::tolower(static_cast<unsigned char>(keyword[i])))
            return false;
    }
    return line.size() == keyword.size() || is_space(line[keyword.size()]);
}

std::string_view strip_statement_end(std::string_view line) {
    if (!line.empty() && line.back() == ';') line.remove_suffix(1);
    return trim(line);
}

std::string_view unquote(std::string_view s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') return s.substr(1, s.size() - 2);
    return s;
}

std::string unexpected(std::string_view line) {
    const std::u32string cps = text_metrics::decode_utf8(line);
    std::string context;
    if (cps.size() <= max_context_chars) {
        context.assign(line);
    } else {
        for (std::size_t i = 0; i < max_context_chars; ++i) text_metrics::append_utf8(context, cps[i]);
        context += "...";
    }
    return "unexpected `" + context + "`";
}

} // namespace diagram_loaders
