#include "json_fields.hpp"

namespace diagram_loaders {

namespace {

using namespace diagram_model;

std::optional<ArrowHead> head_from_string(const std::string& s) {
    if (s.empty() || s == "arrowhead") return ArrowHead::Arrowhead;
    if (s == "none") return ArrowHead::None;
    if (s == "cross") return ArrowHead::Cross;
    if (s == "open") return ArrowHead::Open;
    return std::nullopt;
}

std::optional<NotePlacement> placement_from_string(const std::string& s) {
    if (s.empty() || s == "right_of") return NotePlacement::RightOf;
    if (s == "left_of") return NotePlacement::LeftOf;
    if (s == "over") return NotePlacement::Over;
    return std::nullopt;
}

std::optional<BlockKind> block_kind_from_string(const std::string& s) {
    for (BlockKind kind : { BlockKind::Loop, BlockKind::Opt, BlockKind::Break, BlockKind::Rect, BlockKind::Alt,
             BlockKind::Par, BlockKind::Critical }) {
        if (s == block_keyword(kind)) return kind;
    }
    return std::nullopt;
}

class StatementDecoder {
public:
    explicit StatementDecoder(std::string& error)
        : error_(error)
    {
    }

    bool decode_list(const nlohmann::json& j, const char* key, std::vector<Statement>& out) {
        if (!j.contains(key)) return true;
        if (!j[key].is_array()) return fail(std::string("\"") + key + "\" must be an array");
        for (const auto& s : j[key]) {
            if (!decode(s, out)) return false;
        }
        return true;
    }

private:
    bool fail(const std::string& detail) {
        error_ = detail;
        return false;
    }

    bool require_id(const nlohmann::json& s, const std::string& type, std::string& id) {
        if (!s.contains("id") || !s["id"].is_string()) return fail(type + " statement without a string \"id\"");
        id = s["id"].get<std::string>();
        return true;
    }

    bool participant(const nlohmann::json& s, const std::string& type, ParticipantDecl& decl) {
        if (!require_id(s, type, decl.id)) return false;
        decl.alias = string_field(s, "alias");
        decl.actor = bool_field(s, "actor");
        return true;
    }

    bool decode(const nlohmann::json& s, std::vector<Statement>& out) {
        if (!s.is_object()) return fail("statement must be an object");
        const std::string type = string_field(s, "type");

        if (type == "participant") {
            ParticipantDecl decl;
            if (!participant(s, type, decl)) return false;
            out.emplace_back(std::move(decl));
        } else if (type == "create") {
            Create create;
            if (!participant(s, type, create.participant)) return false;
            out.emplace_back(std::move(create));
        } else if (type == "message") {
            Message msg;
            if (!s.contains("from") || !s["from"].is_string() || !s.contains("to") || !s["to"].is_string())
                return fail("message without string \"from\" and \"to\"");
            msg.from = s["from"].get<std::string>();
            msg.to = s["to"].get<std::string>();
            msg.text = string_field(s, "text");
            msg.arrow.line = string_field(s, "line") == "dotted" ? LineStyle::Dotted : LineStyle::Solid;
            const auto head = head_from_string(string_field(s, "head"));
            if (!head) return fail("message has unknown head \"" + string_field(s, "head") + "\"");
            msg.arrow.head = *head;
            msg.activate_target = bool_field(s, "activate");
            msg.deactivate_source = bool_field(s, "deactivate");
            out.emplace_back(std::move(msg));
        } else if (type == "note") {
            Note note;
            const auto placement = placement_from_string(string_field(s, "placement"));
            if (!placement) return fail("note has unknown placement \"" + string_field(s, "placement") + "\"");
            note.placement = *placement;
            if (s.contains("participants") && s["participants"].is_array()) {
                for (const auto& id : s["participants"])
                    if (id.is_string()) note.participants.push_back(id.get<std::string>());
            }
            if (note.participants.empty() || note.participants.size() > 2)
                return fail("note needs one or two participants");
            note.text = string_field(s, "text");
            out.emplace_back(std::move(note));
        } else if (type == "activate" || type == "deactivate" || type == "destroy") {
            std::string id;
            if (!require_id(s, type, id)) return false;
            if (type == "activate")
                out.emplace_back(Activate{ id });
            else if (type == "deactivate")
                out.emplace_back(Deactivate{ id });
            else
                out.emplace_back(Destroy{ id });
        } else if (type == "autonumber") {
            out.emplace_back(AutoNumber{});
        } else if (type == "block") {
            Block block;
            const auto kind = block_kind_from_string(string_field(s, "kind"));
            if (!kind) return fail("block has unknown kind \"" + string_field(s, "kind") + "\"");
            block.kind = *kind;
            block.label = string_field(s, "label");
            if (!decode_list(s, "body", block.body)) return false;
            if (s.contains("branches") && s["branches"].is_array()) {
                for (const auto& b : s["branches"]) {
                    Branch branch;
                    branch.label = string_field(b, "label");
                    if (!decode_list(b, "body", branch.body)) return false;
                    block.branches.push_back(std::move(branch));
                }
            }
            out.emplace_back(std::move(block));
        } else {
            return fail("unknown statement type \"" + type + "\"");
        }
        return true;
    }

    std::string& error_;
};

} // namespace

std::optional<diagram_model::SequenceDiagram> sequence_from_json(const nlohmann::json& j, std::string& error) {
    diagram_model::SequenceDiagram out;
    if (!j.contains("statements") || !j["statements"].is_array()) {
        error = "sequence diagram needs a \"statements\" array";
        return std::nullopt;
    }
    if (!StatementDecoder(error).decode_list(j, "statements", out.statements)) return std::nullopt;
    return out;
}

} // namespace diagram_loaders
