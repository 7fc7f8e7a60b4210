#include <diagram_loaders/mermaid_parser.hpp>
#include "parse_utils.hpp"

#include <spdlog/spdlog.h>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace diagram_loaders {

namespace {

using diagram_model::Direction;
using diagram_model::EdgeStyle;
using diagram_model::GraphDiagram;
using diagram_model::Node;

bool is_node_id_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_';
}

struct NodeRef {
    std::string id;
    std::string label;
    Node::Shape shape = Node::Shape::Box;
    bool declared = false; // carries a shape and label
};

struct EdgeOp {
    EdgeStyle style = EdgeStyle::Arrow;
    std::string label;
};

// Cursor over one statement line.
class LineScanner {
public:
    explicit LineScanner(std::string_view line)
        : line_(line)
    {
    }

    bool at_end() {
        skip_spaces();
        return pos_ >= line_.size();
    }

    bool consume(char c) {
        skip_spaces();
        if (pos_ < line_.size() && line_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::optional<NodeRef> node() {
        skip_spaces();
        const std::size_t start = pos_;
        while (pos_ < line_.size() && is_node_id_char(line_[pos_])) ++pos_;
        if (pos_ == start) return std::nullopt;
        NodeRef ref;
        ref.id = std::string(line_.substr(start, pos_ - start));
        ref.label = ref.id;

        std::string_view closer;
        if (rest().substr(0, 2) == "((") {
            ref.shape = Node::Shape::Circle;
            closer = "))";
        } else if (rest().substr(0, 1) == "(") {
            ref.shape = Node::Shape::Round;
            closer = ")";
        } else if (rest().substr(0, 1) == "[") {
            ref.shape = Node::Shape::Box;
            closer = "]";
        } else if (rest().substr(0, 1) == "{") {
            ref.shape = Node::Shape::Diamond;
            closer = "}";
        } else {
            return ref;
        }
        pos_ += closer.size();

        std::size_t search_from = pos_;
        if (pos_ < line_.size() && line_[pos_] == '"') {
            const std::size_t quote = line_.find('"', pos_ + 1);
            if (quote == std::string_view::npos) return std::nullopt;
            search_from = quote + 1;
        }
        const std::size_t close = line_.find(closer, search_from);
        if (close == std::string_view::npos) return std::nullopt;
        ref.label = std::string(unquote(trim(line_.substr(pos_, close - pos_))));
        ref.declared = true;
        pos_ = close + closer.size();
        return ref;
    }

    std::optional<EdgeOp> edge() {
        skip_spaces();
        const std::string_view r = rest();
        if (r.empty()) return std::nullopt;
        EdgeOp op;

        if (r[0] == '-') {
            const std::size_t dashes = count_run(r, 0, '-');
            if (dashes == 1 && r.size() > 1 && r[1] == '.') {
                // -.->, -.-, -. label .->
                const std::size_t dots = count_run(r, 1, '.');
                const std::size_t after = 1 + dots;
                if (after < r.size() && r[after] == '-') {
                    const bool head = after + 1 < r.size() && r[after + 1] == '>';
                    op.style = head ? EdgeStyle::DottedArrow : EdgeStyle::DottedLink;
                    pos_ += after + (head ? 2 : 1);
                    return with_pipe_label(op);
                }
                if (after < r.size() && r[after] == ' ')
                    return inline_label(op, 2, ".->", ".-", EdgeStyle::DottedArrow, EdgeStyle::DottedLink);
                return std::nullopt;
            }
            if (dashes >= 2 && dashes < r.size() && r[dashes] == '>') {
                op.style = EdgeStyle::Arrow;
                pos_ += dashes + 1;
                return with_pipe_label(op);
            }
            if (dashes >= 3) {
                op.style = EdgeStyle::OpenLink;
                pos_ += dashes;
                return with_pipe_label(op);
            }
            if (dashes == 2 && dashes < r.size() && r[dashes] == ' ')
                return inline_label(op, 2, "-->", "---", EdgeStyle::Arrow, EdgeStyle::OpenLink);
            return std::nullopt;
        }

        if (r[0] == '=') {
            const std::size_t bars = count_run(r, 0, '=');
            if (bars >= 2 && bars < r.size() && r[bars] == '>') {
                op.style = EdgeStyle::ThickArrow;
                pos_ += bars + 1;
                return with_pipe_label(op);
            }
            if (bars >= 3) {
                op.style = EdgeStyle::ThickLink;
                pos_ += bars;
                return with_pipe_label(op);
            }
            if (bars == 2 && bars < r.size() && r[bars] == ' ')
                return inline_label(op, 2, "==>", "===", EdgeStyle::ThickArrow, EdgeStyle::ThickLink);
        }
        return std::nullopt;
    }

private:
    std::string_view rest() const { return line_.substr(pos_); }

    void skip_spaces() {
        while (pos_ < line_.size() && (line_[pos_] == ' ' || line_[pos_] == '\t')) ++pos_;
    }

    static std::size_t count_run(std::string_view s, std::size_t from, char c) {
        std::size_t n = 0;
        while (from + n < s.size() && s[from + n] == c) ++n;
        return n;
    }

    // `-->|label|` form.
    std::optional<EdgeOp> with_pipe_label(EdgeOp op) {
        if (pos_ < line_.size() && line_[pos_] == '|') {
            const std::size_t close = line_.find('|', pos_ + 1);
            if (close == std::string_view::npos) return std::nullopt;
            op.label = std::string(unquote(trim(line_.substr(pos_ + 1, close - pos_ - 1))));
            pos_ = close + 1;
        }
        return op;
    }

    // `-- label -->` form: the opener is `open_len` characters, the label runs
    // up to whichever terminator comes first.
    std::optional<EdgeOp> inline_label(EdgeOp op, std::size_t open_len, std::string_view arrow_end,
        std::string_view link_end, EdgeStyle arrow_style, EdgeStyle link_style) {
        const std::size_t start = pos_ + open_len;
        const std::size_t arrow_at = line_.find(arrow_end, start);
        const std::size_t link_at = line_.find(link_end, start);
        if (arrow_at == std::string_view::npos && link_at == std::string_view::npos) return std::nullopt;
        const bool is_arrow = arrow_at != std::string_view::npos && arrow_at <= link_at;
        const std::size_t end = is_arrow ? arrow_at : link_at;
        op.style = is_arrow ? arrow_style : link_style;
        op.label = std::string(unquote(trim(line_.substr(start, end - start))));
        pos_ = end + (is_arrow ? arrow_end.size() : link_end.size());
        return op;
    }

    std::string_view line_;
    std::size_t pos_ = 0;
};

class GraphParser {
public:
    explicit GraphParser(std::string_view source)
        : lines_(split_source_lines(source))
    {
    }

    std::optional<GraphDiagram> parse(std::string* error) {
        if (!parse_header() || !parse_lines()) {
            if (error) *error = error_;
            return std::nullopt;
        }
        spdlog::debug("parsed graph with {} nodes, {} edges, {} subgraphs", diagram_.nodes.size(),
            diagram_.edges.size(), diagram_.subgraphs.size());
        return std::move(diagram_);
    }

private:
    bool set_error(std::size_t line_no, std::string_view line) {
        error_ = "syntax error in graph diagram at line " + std::to_string(line_no) + ": " + unexpected(line);
        return false;
    }

    bool parse_header() {
        while (pos_ < lines_.size()) {
            const std::string_view line = trim(lines_[pos_++]);
            if (is_skippable(line)) continue;
            const std::string_view header = strip_statement_end(line);
            std::string_view rest;
            if (starts_with_keyword(header, "graph"))
                rest = trim(header.substr(5));
            else if (starts_with_keyword(header, "flowchart"))
                rest = trim(header.substr(9));
            else
                return set_error(pos_, line);

            if (rest.empty() || rest == "TD" || rest == "TB")
                diagram_.direction = Direction::TopDown;
            else if (rest == "LR")
                diagram_.direction = Direction::LeftRight;
            else
                return set_error(pos_, line);
            return true;
        }
        error_ = "syntax error in graph diagram at line " + std::to_string(lines_.size()) + ": unexpected end of input";
        return false;
    }

    bool parse_lines() {
        while (pos_ < lines_.size()) {
            const std::size_t line_no = ++pos_;
            const std::string_view raw = trim(lines_[line_no - 1]);
            if (is_skippable(raw)) continue;
            const std::string_view line = strip_statement_end(raw);

            if (line == "end") {
                if (open_subgraphs_.empty()) return set_error(line_no, raw);
                open_subgraphs_.pop_back();
                continue;
            }
            if (starts_with_keyword(line, "subgraph")) {
                open_subgraph(trim(line.substr(8)));
                continue;
            }
            if (starts_with_keyword(line, "direction")) {
                spdlog::debug("ignoring subgraph direction on line {}", line_no);
                continue;
            }
            if (!parse_statement(line)) return set_error(line_no, raw);
        }
        if (!open_subgraphs_.empty()) {
            error_ = "syntax error in graph diagram at line " + std::to_string(lines_.size())
                + ": unexpected end of input, missing `end` for subgraph `" + diagram_.subgraphs[open_subgraphs_.back()].label + "`";
            return false;
        }
        return true;
    }

    // "subgraph Title" or "subgraph id[Title]".
    void open_subgraph(std::string_view header) {
        diagram_model::Subgraph sg;
        std::size_t id_end = 0;
        while (id_end < header.size() && is_node_id_char(header[id_end])) ++id_end;
        if (id_end > 0 && id_end < header.size() && header[id_end] == '[' && header.back() == ']') {
            sg.id = std::string(header.substr(0, id_end));
            sg.label = std::string(unquote(trim(header.substr(id_end + 1, header.size() - id_end - 2))));
        } else {
            sg.label = std::string(unquote(header));
            for (char c : sg.label)
                sg.id += c == ' ' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (sg.id.empty()) sg.id = "subgraph_" + std::to_string(diagram_.subgraphs.size() + 1);
        }
        open_subgraphs_.push_back(diagram_.subgraphs.size());
        diagram_.subgraphs.push_back(std::move(sg));
    }

    void mention(const NodeRef& ref) {
        auto it = node_index_.find(ref.id);
        if (it == node_index_.end()) {
            node_index_.emplace(ref.id, diagram_.nodes.size());
            diagram_.nodes.push_back({ ref.id, ref.label, ref.shape });
            if (ref.declared) declared_.insert(ref.id);
        } else if (ref.declared && !declared_.count(ref.id)) {
            Node& node = diagram_.nodes[it->second];
            node.label = ref.label;
            node.shape = ref.shape;
            declared_.insert(ref.id);
        }

        if (!open_subgraphs_.empty() && !claimed_.count(ref.id)) {
            claimed_.insert(ref.id);
            diagram_.subgraphs[open_subgraphs_.back()].node_ids.push_back(ref.id);
        }
    }

    std::optional<std::vector<std::string>> node_group(LineScanner& scanner) {
        std::vector<std::string> ids;
        do {
            auto ref = scanner.node();
            if (!ref) return std::nullopt;
            mention(*ref);
            ids.push_back(ref->id);
        } while (scanner.consume('&'));
        return ids;
    }

    // A --> B & C -- label --> D
    bool parse_statement(std::string_view line) {
        LineScanner scanner(line);
        auto sources = node_group(scanner);
        if (!sources) return false;
        while (!scanner.at_end()) {
            auto op = scanner.edge();
            if (!op) return false;
            auto targets = node_group(scanner);
            if (!targets) return false;
            for (const auto& from : *sources)
                for (const auto& to : *targets)
                    diagram_.edges.push_back({ from, to, op->style, op->label });
            sources = std::move(targets);
        }
        return true;
    }

    std::vector<std::string_view> lines_;
    std::size_t pos_ = 0;
    std::string error_;
    GraphDiagram diagram_;
    std::unordered_map<std::string, std::size_t> node_index_;
    std::unordered_set<std::string> declared_;
    std::unordered_set<std::string> claimed_;
    std::vector<std::size_t> open_subgraphs_;
};

} // namespace

std::optional<diagram_model::GraphDiagram> parse_graph_diagram(std::string_view source, std::string* error) {
    return GraphParser(source).parse(error);
}

} // namespace diagram_loaders
