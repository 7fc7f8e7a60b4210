#include <diagram_loaders/mermaid_parser.hpp>
#include "parse_utils.hpp"

namespace diagram_loaders {

DiagramKind detect_diagram_kind(std::string_view source) {
    for (std::string_view line : split_source_lines(source)) {
        line = trim(line);
        if (is_skippable(line)) continue;
        line = strip_statement_end(line);
        if (starts_with_keyword(line, "graph") || starts_with_keyword(line, "flowchart")) return DiagramKind::Graph;
        if (starts_with_keyword(line, "erDiagram")) return DiagramKind::Er;
        break;
    }
    return DiagramKind::Sequence;
}

std::optional<diagram_model::AnyDiagram> parse_diagram(std::string_view source, std::string* error) {
    switch (detect_diagram_kind(source)) {
    case DiagramKind::Graph:
        if (auto graph = parse_graph_diagram(source, error)) return diagram_model::AnyDiagram(std::move(*graph));
        return std::nullopt;
    case DiagramKind::Er:
        if (auto er = parse_er_diagram(source, error)) return diagram_model::AnyDiagram(std::move(*er));
        return std::nullopt;
    case DiagramKind::Sequence:
        break;
    }
    if (auto seq = parse_sequence_diagram(source, error)) return diagram_model::AnyDiagram(std::move(*seq));
    return std::nullopt;
}

} // namespace diagram_loaders
