#pragma once

#include <diagram_model/diagram.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace diagram_loaders {

enum class DiagramKind { Sequence, Graph, Er };

// Looks at the first line that is neither blank nor a %% comment:
// "graph"/"flowchart" selects Graph, "erDiagram" selects Er, anything else Sequence.
DiagramKind detect_diagram_kind(std::string_view source);

// On failure these return nullopt and, when `error` is given, a message of the
// form "syntax error ... at line N: unexpected `...`".
std::optional<diagram_model::SequenceDiagram> parse_sequence_diagram(std::string_view source,
    std::string* error = nullptr);
std::optional<diagram_model::GraphDiagram> parse_graph_diagram(std::string_view source,
    std::string* error = nullptr);
std::optional<diagram_model::ErDiagram> parse_er_diagram(std::string_view source,
    std::string* error = nullptr);

std::optional<diagram_model::AnyDiagram> parse_diagram(std::string_view source, std::string* error = nullptr);

} // namespace diagram_loaders
