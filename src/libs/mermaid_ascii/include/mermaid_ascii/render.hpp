#pragma once

#include <diagram_model/diagram.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace mermaid_ascii {

struct RenderOptions {
    std::optional<int> max_width; // unbounded when empty
};

// Parses Mermaid source (sequence, graph/flowchart or erDiagram) and renders
// it as box-drawing text. On failure returns nullopt and sets `error`.
std::optional<std::string> render(std::string_view source, std::string* error = nullptr);
std::optional<std::string> render_with_options(std::string_view source, const RenderOptions& options,
    std::string* error = nullptr);

// Lays out and renders an already parsed diagram.
std::optional<std::string> render_diagram(const diagram_model::AnyDiagram& diagram, const RenderOptions& options,
    std::string* error = nullptr);

} // namespace mermaid_ascii
