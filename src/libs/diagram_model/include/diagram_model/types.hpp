#pragma once

#include <string>
#include <vector>

namespace diagram_model {

enum class Direction { TopDown, LeftRight };

struct Node {
    std::string id;
    std::string label;
    enum class Shape { Box, Round, Circle, Diamond };
    Shape shape = Shape::Box;
};

enum class EdgeStyle { Arrow, OpenLink, DottedArrow, DottedLink, ThickArrow, ThickLink };

struct Edge {
    std::string source_node_id;
    std::string target_node_id;
    EdgeStyle style = EdgeStyle::Arrow;
    std::string label;
};

// Nested subgraphs are separate entries; node_ids lists direct members only.
struct Subgraph {
    std::string id;
    std::string label;
    std::vector<std::string> node_ids;
};

struct GraphDiagram {
    Direction direction = Direction::TopDown;
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::vector<Subgraph> subgraphs;
};

inline bool has_arrowhead(EdgeStyle style) {
    return style == EdgeStyle::Arrow || style == EdgeStyle::DottedArrow || style == EdgeStyle::ThickArrow;
}

} // namespace diagram_model
