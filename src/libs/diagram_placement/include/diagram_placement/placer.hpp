#pragma once

#include <diagram_placement/layout_error.hpp>
#include <diagram_placement/types.hpp>
#include <diagram_model/types.hpp>
#include <optional>

namespace diagram_placement {

int node_box_width(const diagram_model::Node& node);
int node_box_height(const diagram_model::Node& node);

// Ranked layout of a flowchart. Subgraphs and the remaining bare nodes are
// laid out as separate groups stacked along the primary axis. With max_width
// set, smaller gaps are tried until the diagram fits; diagrams with subgraphs
// fail straight away when they are too wide.
std::optional<PlacedDiagram> place_diagram(const diagram_model::GraphDiagram& diagram,
    std::optional<int> max_width = std::nullopt, LayoutError* error = nullptr);

} // namespace diagram_placement
