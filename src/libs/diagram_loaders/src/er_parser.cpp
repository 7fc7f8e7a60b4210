#include <diagram_loaders/mermaid_parser.hpp>
#include "parse_utils.hpp"

#include <spdlog/spdlog.h>
#include <cctype>
#include <unordered_map>

namespace diagram_loaders {

namespace {

using diagram_model::Cardinality;
using diagram_model::ErDiagram;

bool is_entity_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_' || c == '-';
}

struct CardinalityToken {
    std::string_view text;
    Cardinality cardinality;
};

const CardinalityToken left_tokens[] = {
    { "||", Cardinality::ExactlyOne },
    { "|o", Cardinality::ZeroOrOne },
    { "o|", Cardinality::ZeroOrOne },
    { "}|", Cardinality::OneOrMany },
    { "}o", Cardinality::ZeroOrMany },
};

const CardinalityToken right_tokens[] = {
    { "||", Cardinality::ExactlyOne },
    { "o|", Cardinality::ZeroOrOne },
    { "|o", Cardinality::ZeroOrOne },
    { "|{", Cardinality::OneOrMany },
    { "o{", Cardinality::ZeroOrMany },
};

template <std::size_t N>
std::optional<Cardinality> match_cardinality(const CardinalityToken (&tokens)[N], std::string_view text) {
    for (const auto& t : tokens)
        if (t.text == text) return t.cardinality;
    return std::nullopt;
}

std::vector<std::string_view> split_words(std::string_view s) {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
        const std::size_t start = i;
        while (i < s.size() && s[i] != ' ' && s[i] != '\t') ++i;
        if (i > start) words.push_back(s.substr(start, i - start));
    }
    return words;
}

// "type name", "type name PK", "type name PK, FK", optionally followed by a quoted comment.
std::optional<diagram_model::Attribute> parse_attribute(std::string_view line) {
    const std::size_t quote = line.find('"');
    if (quote != std::string_view::npos) line = trim(line.substr(0, quote));
    const auto words = split_words(line);
    if (words.size() < 2) return std::nullopt;
    diagram_model::Attribute attr;
    attr.type = std::string(words[0]);
    attr.name = std::string(words[1]);
    for (std::size_t i = 2; i < words.size(); ++i) {
        std::string_view key = words[i];
        if (!key.empty() && key.back() == ',') key.remove_suffix(1);
        if (key != "PK" && key != "FK" && key != "UK") return std::nullopt;
        if (!attr.key.empty()) attr.key += ", ";
        attr.key += std::string(key);
    }
    return attr;
}

class ErParser {
public:
    explicit ErParser(std::string_view source)
        : lines_(split_source_lines(source))
    {
    }

    std::optional<ErDiagram> parse(std::string* error) {
        if (!parse_header() || !parse_lines()) {
            if (error) *error = error_;
            return std::nullopt;
        }
        spdlog::debug("parsed ER diagram with {} entities, {} relationships", diagram_.entities.size(),
            diagram_.relationships.size());
        return std::move(diagram_);
    }

private:
    bool set_error(std::size_t line_no, std::string_view line) {
        error_ = "syntax error in ER diagram at line " + std::to_string(line_no) + ": " + unexpected(line);
        return false;
    }

    bool parse_header() {
        while (pos_ < lines_.size()) {
            const std::string_view line = trim(lines_[pos_++]);
            if (is_skippable(line)) continue;
            if (strip_statement_end(line) == "erDiagram") return true;
            return set_error(pos_, line);
        }
        error_ = "syntax error in ER diagram at line " + std::to_string(lines_.size()) + ": unexpected end of input";
        return false;
    }

    std::size_t entity(std::string_view name) {
        auto it = entity_index_.find(std::string(name));
        if (it != entity_index_.end()) return it->second;
        const std::size_t index = diagram_.entities.size();
        entity_index_.emplace(std::string(name), index);
        diagram_.entities.push_back({ std::string(name), {} });
        return index;
    }

    bool parse_lines() {
        while (pos_ < lines_.size()) {
            const std::size_t line_no = ++pos_;
            const std::string_view raw = trim(lines_[line_no - 1]);
            if (is_skippable(raw)) continue;
            const std::string_view line = strip_statement_end(raw);

            std::size_t name_end = 0;
            while (name_end < line.size() && is_entity_char(line[name_end])) ++name_end;
            if (name_end == 0) return set_error(line_no, raw);
            const std::string_view name = line.substr(0, name_end);
            const std::string_view rest = trim(line.substr(name_end));

            if (rest.empty()) {
                entity(name);
            } else if (rest == "{") {
                if (!parse_entity_block(entity(name))) return false;
            } else if (rest == "{}" || rest == "{ }") {
                entity(name);
            } else if (!parse_relationship(name, rest)) {
                return set_error(line_no, raw);
            }
        }
        return true;
    }

    bool parse_entity_block(std::size_t index) {
        const std::size_t open_line = pos_;
        while (pos_ < lines_.size()) {
            const std::size_t line_no = ++pos_;
            const std::string_view raw = trim(lines_[line_no - 1]);
            if (is_skippable(raw)) continue;
            if (raw == "}") return true;
            auto attr = parse_attribute(raw);
            if (!attr) return set_error(line_no, raw);
            diagram_.entities[index].attributes.push_back(std::move(*attr));
        }
        error_ = "syntax error in ER diagram at line " + std::to_string(lines_.size())
            + ": unexpected end of input, missing `}` for entity opened at line " + std::to_string(open_line);
        return false;
    }

    // rest is "CARD--CARD TARGET : label" or with ".." for a non-identifying relationship.
    bool parse_relationship(std::string_view from, std::string_view rest) {
        if (rest.size() < 6) return false;
        const auto left = match_cardinality(left_tokens, rest.substr(0, 2));
        const std::string_view line_kind = rest.substr(2, 2);
        const auto right = match_cardinality(right_tokens, rest.substr(4, 2));
        if (!left || !right || (line_kind != "--" && line_kind != "..")) return false;

        rest = trim(rest.substr(6));
        std::size_t to_end = 0;
        while (to_end < rest.size() && is_entity_char(rest[to_end])) ++to_end;
        if (to_end == 0) return false;
        const std::string_view to = rest.substr(0, to_end);
        rest = trim(rest.substr(to_end));
        if (rest.empty() || rest.front() != ':') return false;

        diagram_model::Relationship rel;
        rel.from = std::string(from);
        rel.to = std::string(to);
        rel.left_cardinality = *left;
        rel.right_cardinality = *right;
        rel.label = std::string(unquote(trim(rest.substr(1))));
        rel.identifying = line_kind == "--";
        entity(from);
        entity(to);
        diagram_.relationships.push_back(std::move(rel));
        return true;
    }

    std::vector<std::string_view> lines_;
    std::size_t pos_ = 0;
    std::string error_;
    ErDiagram diagram_;
    std::unordered_map<std::string, std::size_t> entity_index_;
};

} // namespace

std::optional<diagram_model::ErDiagram> parse_er_diagram(std::string_view source, std::string* error) {
    return ErParser(source).parse(error);
}

} // namespace diagram_loaders
