#include <text_metrics/text_metrics.hpp>
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace text_metrics {

namespace {

const char32_t replacement_char = 0xFFFD;
const char32_t ellipsis_char = 0x2026;

// Length of a line-break marker starting at pos, 0 if there is none.
std::size_t break_marker_length(std::string_view text, std::size_t pos) {
    static const std::string_view markers[] = { "<br />", "<br/>", "<br>" };
    for (const auto marker : markers) {
        if (pos + marker.size() > text.size()) continue;
        bool match = true;
        for (std::size_t k = 0; k < marker.size(); ++k) {
            const auto ch = static_cast<unsigned char>(text[pos + k]);
            if (std::tolower(ch) != marker[k]) {
                match = false;
                break;
            }
        }
        if (match) return marker.size();
    }
    return 0;
}

std::string truncate_line(std::string_view line, int max_width) {
    if (display_width(line) <= max_width) return std::string(line);
    std::string out;
    int used = 0;
    for (const char32_t cp : decode_utf8(line)) {
        const int w = char_width(cp);
        if (used + w > max_width - 1) break;
        append_utf8(out, cp);
        used += w;
    }
    append_utf8(out, ellipsis_char);
    return out;
}

} // namespace

int char_width(char32_t cp) {
    const auto c = static_cast<UChar32>(cp);
    if (c < 0x20 || (c >= 0x7F && c < 0xA0)) return 0;
    const int8_t type = u_charType(c);
    if (type == U_NON_SPACING_MARK || type == U_ENCLOSING_MARK || type == U_FORMAT_CHAR) return 0;
    const int32_t syllable = u_getIntPropertyValue(c, UCHAR_HANGUL_SYLLABLE_TYPE);
    if (syllable == U_HST_VOWEL_JAMO || syllable == U_HST_TRAILING_JAMO) return 0;
    const int32_t east_asian = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
    if (east_asian == U_EA_WIDE || east_asian == U_EA_FULLWIDTH) return 2;
    return 1;
}

int display_width(std::string_view text) {
    int width = 0;
    for (const char32_t cp : decode_utf8(text)) width += char_width(cp);
    return width;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t marker = text[i] == '<' ? break_marker_length(text, i) : 0;
        if (marker > 0) {
            lines.emplace_back(text.substr(start, i - start));
            i += marker;
            start = i;
        } else {
            ++i;
        }
    }
    lines.emplace_back(text.substr(start));
    return lines;
}

int multiline_width(std::string_view text) {
    int width = 0;
    for (const auto& line : split_lines(text)) width = std::max(width, display_width(line));
    return width;
}

int line_count(std::string_view text) {
    return static_cast<int>(split_lines(text).size());
}

std::u32string decode_utf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c = 0;
        U8_NEXT(bytes, i, length, c);
        out.push_back(c < 0 ? replacement_char : static_cast<char32_t>(c));
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    uint8_t buf[U8_MAX_LENGTH];
    int32_t len = 0;
    UBool error = false;
    U8_APPEND(buf, len, U8_MAX_LENGTH, static_cast<UChar32>(cp), error);
    if (error) {
        len = 0;
        U8_APPEND_UNSAFE(buf, len, static_cast<UChar32>(replacement_char));
    }
    out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(len));
}

std::string truncate_to_width(std::string_view text, int max_width) {
    if (max_width < 1) return {};
    const auto lines = split_lines(text);
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "<br/>";
        out += truncate_line(lines[i], max_width);
    }
    return out;
}

} // namespace text_metrics
