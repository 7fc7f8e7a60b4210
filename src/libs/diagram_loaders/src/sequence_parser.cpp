#include <diagram_loaders/mermaid_parser.hpp>
#include "parse_utils.hpp"

#include <spdlog/spdlog.h>
#include <cctype>

namespace diagram_loaders {

namespace {

using namespace diagram_model;

struct ArrowToken {
    std::string_view text;
    Arrow arrow;
};

// Longest tokens first so "-->>" is not read as "-->" followed by ">".
const ArrowToken arrow_tokens[] = {
    { "-->>", { LineStyle::Dotted, ArrowHead::Arrowhead } },
    { "--x", { LineStyle::Dotted, ArrowHead::Cross } },
    { "--)", { LineStyle::Dotted, ArrowHead::Open } },
    { "-->", { LineStyle::Dotted, ArrowHead::None } },
    { "->>", { LineStyle::Solid, ArrowHead::Arrowhead } },
    { "-x", { LineStyle::Solid, ArrowHead::Cross } },
    { "-)", { LineStyle::Solid, ArrowHead::Open } },
    { "->", { LineStyle::Solid, ArrowHead::None } },
};

struct BlockToken {
    std::string_view keyword;
    BlockKind kind;
};

const BlockToken block_tokens[] = {
    { "loop", BlockKind::Loop },
    { "opt", BlockKind::Opt },
    { "break", BlockKind::Break },
    { "rect", BlockKind::Rect },
    { "alt", BlockKind::Alt },
    { "par", BlockKind::Par },
    { "critical", BlockKind::Critical },
};

bool is_identifier_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_';
}

std::size_t scan_identifier(std::string_view s, std::size_t pos) {
    while (pos < s.size() && is_identifier_char(s[pos])) ++pos;
    return pos;
}

std::size_t skip_spaces(std::string_view s, std::size_t pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
    return pos;
}

bool is_identifier(std::string_view s) {
    return !s.empty() && scan_identifier(s, 0) == s.size();
}

std::optional<ParticipantDecl> parse_participant(std::string_view rest, bool actor) {
    rest = trim(rest);
    const std::size_t end = scan_identifier(rest, 0);
    if (end == 0) return std::nullopt;
    ParticipantDecl decl;
    decl.id = std::string(rest.substr(0, end));
    decl.actor = actor;
    const std::string_view tail = trim(rest.substr(end));
    if (tail.empty()) return decl;
    if (!starts_with_keyword(tail, "as")) return std::nullopt;
    const std::string_view alias = trim(tail.substr(2));
    if (alias.empty()) return std::nullopt;
    decl.alias = std::string(alias);
    return decl;
}

std::optional<Message> parse_message(std::string_view line) {
    std::size_t pos = scan_identifier(line, 0);
    if (pos == 0) return std::nullopt;
    Message msg;
    msg.from = std::string(line.substr(0, pos));
    pos = skip_spaces(line, pos);

    const ArrowToken* token = nullptr;
    for (const auto& t : arrow_tokens) {
        if (line.substr(pos, t.text.size()) == t.text) {
            token = &t;
            break;
        }
    }
    if (!token) return std::nullopt;
    msg.arrow = token->arrow;
    pos += token->text.size();
    if (pos < line.size() && line[pos] == '+') {
        msg.activate_target = true;
        ++pos;
    } else if (pos < line.size() && line[pos] == '-') {
        msg.deactivate_source = true;
        ++pos;
    }
    pos = skip_spaces(line, pos);

    const std::size_t to_end = scan_identifier(line, pos);
    if (to_end == pos) return std::nullopt;
    msg.to = std::string(line.substr(pos, to_end - pos));
    pos = skip_spaces(line, to_end);
    if (pos >= line.size() || line[pos] != ':') return std::nullopt;
    msg.text = std::string(trim(line.substr(pos + 1)));
    return msg;
}

// "right of A: text", "left of A: text", "over A: text" or "over A,B: text".
std::optional<Note> parse_note(std::string_view rest) {
    Note note;
    rest = trim(rest);
    if (starts_with_keyword_nocase(rest, "right") || starts_with_keyword_nocase(rest, "left")) {
        const bool right = starts_with_keyword_nocase(rest, "right");
        note.placement = right ? NotePlacement::RightOf : NotePlacement::LeftOf;
        rest = trim(rest.substr(right ? 5 : 4));
        if (!starts_with_keyword_nocase(rest, "of")) return std::nullopt;
        rest = trim(rest.substr(2));
    } else if (starts_with_keyword_nocase(rest, "over")) {
        note.placement = NotePlacement::Over;
        rest = trim(rest.substr(4));
    } else {
        return std::nullopt;
    }

    const std::size_t colon = rest.find(':');
    if (colon == std::string_view::npos) return std::nullopt;
    std::string_view targets = rest.substr(0, colon);
    note.text = std::string(trim(rest.substr(colon + 1)));

    const std::size_t comma = targets.find(',');
    if (comma != std::string_view::npos) {
        if (note.placement != NotePlacement::Over) return std::nullopt;
        note.participants.emplace_back(trim(targets.substr(0, comma)));
        note.participants.emplace_back(trim(targets.substr(comma + 1)));
    } else {
        note.participants.emplace_back(trim(targets));
    }
    for (const auto& id : note.participants)
        if (!is_identifier(id)) return std::nullopt;
    return note;
}

class SequenceParser {
public:
    explicit SequenceParser(std::string_view source)
        : lines_(split_source_lines(source))
    {
    }

    std::optional<SequenceDiagram> parse(std::string* error) {
        if (!parse_header()) return fail(error);
        SequenceDiagram diagram;
        Stop stop = Stop::Eof;
        std::string divider_label;
        if (!parse_body(diagram.statements, nullptr, stop, divider_label)) return fail(error);
        spdlog::debug("parsed sequence diagram with {} top-level statements", diagram.statements.size());
        return diagram;
    }

private:
    enum class Stop { Eof, End, Divider };

    std::optional<SequenceDiagram> fail(std::string* error) const {
        if (error) *error = error_;
        return std::nullopt;
    }

    bool set_error(std::size_t line_no, std::string_view line) {
        error_ = "syntax error at line " + std::to_string(line_no) + ": " + unexpected(line);
        return false;
    }

    bool parse_header() {
        while (pos_ < lines_.size()) {
            const std::string_view line = trim(lines_[pos_++]);
            if (is_skippable(line)) continue;
            if (strip_statement_end(line) == "sequenceDiagram") return true;
            return set_error(pos_, line);
        }
        error_ = "syntax error at line " + std::to_string(lines_.size()) + ": unexpected end of input";
        return false;
    }

    // Reads statements into `body` until "end", a divider of `open`, or end of input.
    bool parse_body(std::vector<Statement>& body, const Block* open, Stop& stop, std::string& divider_label) {
        while (pos_ < lines_.size()) {
            const std::size_t line_no = ++pos_;
            const std::string_view raw = trim(lines_[line_no - 1]);
            if (is_skippable(raw)) continue;
            const std::string_view line = strip_statement_end(raw);

            if (line == "end") {
                if (!open) return set_error(line_no, raw);
                stop = Stop::End;
                return true;
            }
            if (open) {
                const std::string_view divider = branch_keyword(open->kind);
                if (!divider.empty() && starts_with_keyword(line, divider)) {
                    divider_label = std::string(trim(line.substr(divider.size())));
                    stop = Stop::Divider;
                    return true;
                }
            }
            if (!parse_statement(body, line, line_no)) return false;
        }
        if (open) {
            error_ = "syntax error at line " + std::to_string(lines_.size()) + ": unexpected end of input, missing `end` for `"
                + block_keyword(open->kind) + "`";
            return false;
        }
        stop = Stop::Eof;
        return true;
    }

    bool parse_block(std::vector<Statement>& body, BlockKind kind, std::string_view label) {
        Block block;
        block.kind = kind;
        block.label = std::string(label);
        Stop stop = Stop::Eof;
        std::string divider_label;
        if (!parse_body(block.body, &block, stop, divider_label)) return false;
        while (stop == Stop::Divider) {
            Branch branch;
            branch.label = divider_label;
            if (!parse_body(branch.body, &block, stop, divider_label)) return false;
            block.branches.push_back(std::move(branch));
        }
        body.emplace_back(std::move(block));
        return true;
    }

    bool parse_statement(std::vector<Statement>& body, std::string_view line, std::size_t line_no) {
        for (const auto& token : block_tokens) {
            if (starts_with_keyword(line, token.keyword))
                return parse_block(body, token.kind, trim(line.substr(token.keyword.size())));
        }

        if (starts_with_keyword(line, "participant") || starts_with_keyword(line, "actor")) {
            const bool actor = starts_with_keyword(line, "actor");
            auto decl = parse_participant(line.substr(actor ? 5 : 11), actor);
            if (!decl) return set_error(line_no, line);
            body.emplace_back(std::move(*decl));
            return true;
        }
        if (starts_with_keyword(line, "create")) {
            const std::string_view rest = trim(line.substr(6));
            const bool actor = starts_with_keyword(rest, "actor");
            if (!actor && !starts_with_keyword(rest, "participant")) return set_error(line_no, line);
            auto decl = parse_participant(rest.substr(actor ? 5 : 11), actor);
            if (!decl) return set_error(line_no, line);
            body.emplace_back(Create{ std::move(*decl) });
            return true;
        }
        if (starts_with_keyword(line, "destroy") || starts_with_keyword(line, "activate")
            || starts_with_keyword(line, "deactivate")) {
            const std::size_t space = line.find_first_of(" \t");
            if (space == std::string_view::npos) return set_error(line_no, line);
            const std::string_view keyword = line.substr(0, space);
            const std::string id(trim(line.substr(space)));
            if (!is_identifier(id)) return set_error(line_no, line);
            if (keyword == "destroy")
                body.emplace_back(Destroy{ id });
            else if (keyword == "activate")
                body.emplace_back(Activate{ id });
            else
                body.emplace_back(Deactivate{ id });
            return true;
        }
        if (starts_with_keyword(line, "autonumber")) {
            body.emplace_back(AutoNumber{});
            return true;
        }
        if (starts_with_keyword_nocase(line, "note")) {
            auto note = parse_note(line.substr(4));
            if (!note) return set_error(line_no, line);
            body.emplace_back(std::move(*note));
            return true;
        }

        auto message = parse_message(line);
        if (!message) return set_error(line_no, line);
        body.emplace_back(std::move(*message));
        return true;
    }

    std::vector<std::string_view> lines_;
    std::size_t pos_ = 0;
    std::string error_;
};

} // namespace

std::optional<diagram_model::SequenceDiagram> parse_sequence_diagram(std::string_view source, std::string* error) {
    return SequenceParser(source).parse(error);
}

} // namespace diagram_loaders
