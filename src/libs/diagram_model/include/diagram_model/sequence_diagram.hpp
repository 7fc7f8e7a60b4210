#pragma once

#include <string>
#include <variant>
#include <vector>

namespace diagram_model {

struct ParticipantDecl {
    std::string id;
    std::string alias;
    bool actor = false;

    const std::string& display_name() const { return alias.empty() ? id : alias; }
};

enum class LineStyle { Solid, Dotted };
enum class ArrowHead { None, Arrowhead, Cross, Open };

struct Arrow {
    LineStyle line = LineStyle::Solid;
    ArrowHead head = ArrowHead::Arrowhead;
};

struct Message {
    std::string from;
    std::string to;
    Arrow arrow;
    std::string text;
    bool activate_target = false;
    bool deactivate_source = false;
};

enum class NotePlacement { RightOf, LeftOf, Over };

struct Note {
    NotePlacement placement = NotePlacement::RightOf;
    std::vector<std::string> participants; // one id, or two for "over A,B"
    std::string text;
};

struct Activate {
    std::string id;
};

struct Deactivate {
    std::string id;
};

struct Create {
    ParticipantDecl participant;
};

struct Destroy {
    std::string id;
};

struct AutoNumber {};

enum class BlockKind { Loop, Opt, Break, Rect, Alt, Par, Critical };

struct Block;

using Statement = std::variant<ParticipantDecl, Message, Note, Activate, Deactivate,
    Create, Destroy, AutoNumber, Block>;

// "else" (alt), "and" (par) or "option" (critical) section.
struct Branch {
    std::string label;
    std::vector<Statement> body;
};

struct Block {
    BlockKind kind = BlockKind::Loop;
    std::string label;
    std::vector<Statement> body;
    std::vector<Branch> branches;
};

struct SequenceDiagram {
    std::vector<Statement> statements;
};

inline const char* block_keyword(BlockKind kind) {
    switch (kind) {
    case BlockKind::Loop: return "loop";
    case BlockKind::Opt: return "opt";
    case BlockKind::Break: return "break";
    case BlockKind::Rect: return "rect";
    case BlockKind::Alt: return "alt";
    case BlockKind::Par: return "par";
    case BlockKind::Critical: return "critical";
    }
    return "";
}

// Keyword introducing a divider branch of the given block.
inline const char* branch_keyword(BlockKind kind) {
    switch (kind) {
    case BlockKind::Alt: return "else";
    case BlockKind::Par: return "and";
    case BlockKind::Critical: return "option";
    default: return "";
    }
}

} // namespace diagram_model
