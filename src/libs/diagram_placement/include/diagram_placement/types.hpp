#pragma once

#include <diagram_model/types.hpp>
#include <diagram_placement/connection_lines.hpp>
#include <string>
#include <vector>

namespace diagram_placement {

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int right() const { return x + width - 1; }
    int bottom() const { return y + height - 1; }
    bool contains(int col, int row) const {
        return col >= x && col <= right() && row >= y && row <= bottom();
    }
    bool contains(const Rect& r) const {
        return r.x >= x && r.right() <= right() && r.y >= y && r.bottom() <= bottom();
    }
    bool overlaps(const Rect& r) const {
        return x <= r.right() && r.x <= right() && y <= r.bottom() && r.y <= bottom();
    }
};

struct PlacedNode {
    std::string node_id;
    std::string label;
    diagram_model::Node::Shape shape = diagram_model::Node::Shape::Box;
    Rect rect;
    int center_x = 0;
    int center_y = 0;
    int rank = 0;
};

struct PlacedEdge {
    std::string source_node_id;
    std::string target_node_id;
    diagram_model::EdgeStyle style = diagram_model::EdgeStyle::Arrow;
    std::string label;
    // Set for an edge that jumps over nodes of an intermediate rank: the
    // cells from just outside the source to the arrowhead cell.
    std::vector<GridPoint> detour;
};

struct PlacedSubgraph {
    std::string subgraph_id;
    std::string label;
    Rect rect;
    std::vector<std::string> node_ids;
};

struct PlacedDiagram {
    diagram_model::Direction direction = diagram_model::Direction::TopDown;
    std::vector<PlacedNode> placed_nodes;
    std::vector<PlacedEdge> placed_edges;
    std::vector<PlacedSubgraph> placed_subgraphs;
    int width = 0;
    int height = 0;

    const PlacedNode* find_node(const std::string& id) const {
        for (const auto& n : placed_nodes)
            if (n.node_id == id) return &n;
        return nullptr;
    }
};

} // namespace diagram_placement
