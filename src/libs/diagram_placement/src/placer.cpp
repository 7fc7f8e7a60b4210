#include <diagram_placement/placer.hpp>
#include <diagram_placement/lanes.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <diagram_placement/ranking.hpp>
#include <text_metrics/text_metrics.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace diagram_placement {

namespace {

using diagram_model::Direction;
using diagram_model::Node;

struct GraphSpacing {
    int node_gap = 0; // between nodes of one rank
    int rank_gap = 0; // between ranks
};

GraphSpacing default_spacing(Direction direction) {
    if (direction == Direction::TopDown)
        return { layout::graph::td_node_gap, layout::graph::td_rank_spacing };
    return { layout::graph::lr_node_gap, layout::graph::lr_rank_gap };
}

// Positions relative to the group's own origin.
struct GroupLayout {
    std::vector<PlacedNode> nodes;
    int width = 0;
    int height = 0;
};

GroupLayout layout_group(const std::vector<const Node*>& members,
    const std::vector<diagram_model::Edge>& edges, Direction direction, const GraphSpacing& spacing)
{
    GroupLayout out;
    std::vector<std::string> ids;
    std::unordered_set<std::string> member_ids;
    for (const Node* n : members) {
        ids.push_back(n->id);
        member_ids.insert(n->id);
    }
    std::vector<std::pair<std::string, std::string>> internal;
    std::vector<const diagram_model::Edge*> internal_edges;
    for (const auto& e : edges) {
        if (!member_ids.count(e.source_node_id) || !member_ids.count(e.target_node_id)) continue;
        internal.emplace_back(e.source_node_id, e.target_node_id);
        internal_edges.push_back(&e);
    }
    const RankMap ranks = assign_ranks(ids, internal);

    int max_rank = 0;
    for (const auto& [id, rank] : ranks) max_rank = std::max(max_rank, rank);
    std::vector<std::vector<const Node*>> by_rank(static_cast<std::size_t>(max_rank) + 1);
    for (const Node* n : members) by_rank[static_cast<std::size_t>(ranks.at(n->id))].push_back(n);

    auto place = [&](const Node* n, int x, int y, int rank) {
        PlacedNode pn;
        pn.node_id = n->id;
        pn.label = n->label;
        pn.shape = n->shape;
        pn.rect = { x, y, node_box_width(*n), node_box_height(*n) };
        pn.center_x = x + pn.rect.width / 2;
        pn.center_y = y + pn.rect.height / 2;
        pn.rank = rank;
        out.nodes.push_back(std::move(pn));
    };

    if (direction == Direction::TopDown) {
        std::vector<int> rank_widths;
        int widest = 0;
        for (const auto& rank_nodes : by_rank) {
            int total = 0;
            for (const Node* n : rank_nodes) total += node_box_width(*n);
            if (!rank_nodes.empty()) total += static_cast<int>(rank_nodes.size() - 1) * spacing.node_gap;
            rank_widths.push_back(total);
            widest = std::max(widest, total);
        }
        int y = 0;
        for (std::size_t r = 0; r < by_rank.size(); ++r) {
            if (by_rank[r].empty()) continue;
            int x = (widest - rank_widths[r]) / 2;
            int rank_height = 0;
            for (const Node* n : by_rank[r]) {
                place(n, x, y, static_cast<int>(r));
                x += node_box_width(*n) + spacing.node_gap;
                rank_height = std::max(rank_height, node_box_height(*n));
            }
            y += rank_height + spacing.rank_gap;
        }
        out.width = widest;
        out.height = std::max(0, y - spacing.rank_gap);
        return out;
    }

    // Left to right: a label crossing from rank r to r + 1 widens that gap.
    std::vector<int> gap_after(by_rank.size(), spacing.rank_gap);
    for (const auto* e : internal_edges) {
        if (e->label.empty()) continue;
        const int from_rank = ranks.at(e->source_node_id);
        if (ranks.at(e->target_node_id) != from_rank + 1) continue;
        const int demand = text_metrics::display_width(e->label) + layout::graph::lr_label_margin;
        auto& gap = gap_after[static_cast<std::size_t>(from_rank)];
        gap = std::max(gap, demand);
    }
    int x = 0;
    for (std::size_t r = 0; r < by_rank.size(); ++r) {
        if (by_rank[r].empty()) continue;
        int y = 0;
        int rank_width = 0;
        for (const Node* n : by_rank[r]) {
            place(n, x, y, static_cast<int>(r));
            y += node_box_height(*n) + spacing.node_gap;
            rank_width = std::max(rank_width, node_box_width(*n));
        }
        out.height = std::max(out.height, y - spacing.node_gap);
        out.width = x + rank_width;
        x += rank_width + gap_after[r];
    }
    return out;
}

// True when some other node lies wholly between the two along the primary axis.
bool jumps_over_nodes(const PlacedDiagram& placed, const PlacedNode& from, const PlacedNode& to) {
    const bool top_down = placed.direction == Direction::TopDown;
    for (const auto& n : placed.placed_nodes) {
        const bool between = top_down ? n.rect.y > from.rect.bottom() && n.rect.bottom() < to.rect.y
                                      : n.rect.x > from.rect.right() && n.rect.right() < to.rect.x;
        if (between) return true;
    }
    return false;
}

void route_rank_skips(PlacedDiagram& placed) {
    std::vector<Rect> boxes;
    std::vector<Rect> frames;
    for (const auto& pn : placed.placed_nodes) boxes.push_back(pn.rect);
    for (const auto& ps : placed.placed_subgraphs) frames.push_back(ps.rect);
    LaneRouter router(std::move(boxes), std::move(frames));

    for (auto& pe : placed.placed_edges) {
        const PlacedNode* from = placed.find_node(pe.source_node_id);
        const PlacedNode* to = placed.find_node(pe.target_node_id);
        if (!from || !to || from == to || !jumps_over_nodes(placed, *from, *to)) continue;
        if (placed.direction == Direction::TopDown) {
            pe.detour = router.route_beside({ from->center_x, from->rect.bottom() + 1 },
                { to->center_x, to->rect.y - 1 });
        } else {
            pe.detour = router.route_below({ from->rect.right() + 1, from->center_y },
                { to->rect.x - 1, to->center_y }, 1, 1);
        }
        spdlog::debug("edge {} -> {} skips a rank, routed along a lane", pe.source_node_id, pe.target_node_id);
        for (const auto& p : pe.detour) {
            placed.width = std::max(placed.width, p.col + 1);
            placed.height = std::max(placed.height, p.row + 1);
        }
    }
}

// Top-down labels go right of the arrowhead, several into one node joined
// by ", ".
void reserve_label_room(PlacedDiagram& placed) {
    std::map<std::string, int> label_width;
    for (const auto& pe : placed.placed_edges) {
        if (pe.label.empty()) continue;
        int& width = label_width[pe.target_node_id];
        width += (width > 0 ? 2 : 0) + text_metrics::display_width(pe.label);
    }
    for (const auto& [id, width] : label_width)
        if (const PlacedNode* n = placed.find_node(id)) placed.width = std::max(placed.width, n->center_x + 2 + width);
}

struct Group {
    const diagram_model::Subgraph* subgraph = nullptr; // null for bare nodes
    std::vector<const Node*> members;
};

PlacedDiagram layout_with_spacing(const std::vector<Group>& groups,
    const diagram_model::GraphDiagram& diagram, const GraphSpacing& spacing)
{
    PlacedDiagram out;
    out.direction = diagram.direction;
    const bool top_down = diagram.direction == Direction::TopDown;

    struct GroupBlock {
        GroupLayout inner;
        int width = 0;
        int height = 0;
        int content_x = 0;
        int content_y = 0;
    };
    std::vector<GroupBlock> blocks;
    int widest = 0;
    for (const auto& g : groups) {
        GroupBlock b;
        b.inner = layout_group(g.members, diagram.edges, diagram.direction, spacing);
        b.width = b.inner.width;
        b.height = b.inner.height;
        if (g.subgraph) {
            const int title = text_metrics::display_width(g.subgraph->label) + layout::graph::subgraph_title_decoration;
            b.content_x = layout::graph::subgraph_pad_left;
            b.content_y = layout::graph::subgraph_pad_top;
            b.width = std::max(b.inner.width + layout::graph::subgraph_pad_left + layout::graph::subgraph_pad_right, title);
            b.height = b.inner.height + layout::graph::subgraph_pad_top + layout::graph::subgraph_pad_bottom;
        }
        widest = std::max(widest, b.width);
        blocks.push_back(std::move(b));
    }

    int cursor = 0;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        GroupBlock& b = blocks[i];
        const int gx = top_down ? (widest - b.width) / 2 : cursor;
        const int gy = top_down ? cursor : 0;
        for (auto& pn : b.inner.nodes) {
            pn.rect.x += gx + b.content_x;
            pn.rect.y += gy + b.content_y;
            pn.center_x += gx + b.content_x;
            pn.center_y += gy + b.content_y;
            out.placed_nodes.push_back(pn);
        }
        if (groups[i].subgraph) {
            PlacedSubgraph ps;
            ps.subgraph_id = groups[i].subgraph->id;
            ps.label = groups[i].subgraph->label;
            ps.rect = { gx, gy, b.width, b.height };
            for (const Node* n : groups[i].members) ps.node_ids.push_back(n->id);
            out.placed_subgraphs.push_back(std::move(ps));
        }
        cursor += top_down ? b.height + layout::graph::td_group_gap : b.width + layout::graph::lr_group_gap;
    }

    for (const auto& e : diagram.edges) {
        PlacedEdge pe;
        pe.source_node_id = e.source_node_id;
        pe.target_node_id = e.target_node_id;
        pe.style = e.style;
        pe.label = e.label;
        out.placed_edges.push_back(std::move(pe));
    }

    for (const auto& pn : out.placed_nodes) {
        out.width = std::max(out.width, pn.rect.right() + 1);
        out.height = std::max(out.height, pn.rect.bottom() + 1);
    }
    for (const auto& ps : out.placed_subgraphs) {
        out.width = std::max(out.width, ps.rect.right() + 1);
        out.height = std::max(out.height, ps.rect.bottom() + 1);
    }
    route_rank_skips(out);
    if (top_down) reserve_label_room(out);
    return out;
}

// Declared nodes plus any edge endpoint that was never declared.
std::vector<Node> collect_nodes(const diagram_model::GraphDiagram& diagram) {
    std::vector<Node> nodes = diagram.nodes;
    std::unordered_set<std::string> seen;
    for (const auto& n : nodes) seen.insert(n.id);
    auto ensure = [&](const std::string& id) {
        if (seen.count(id)) return;
        spdlog::warn("edge references undeclared node {}, adding it", id);
        seen.insert(id);
        Node n;
        n.id = id;
        n.label = id;
        nodes.push_back(std::move(n));
    };
    for (const auto& e : diagram.edges) {
        ensure(e.source_node_id);
        ensure(e.target_node_id);
    }
    return nodes;
}

// One group per subgraph (first subgraph listing a node owns it), then bare nodes.
std::vector<Group> partition(const std::vector<Node>& nodes, const diagram_model::GraphDiagram& diagram) {
    std::vector<Group> groups;
    std::unordered_set<std::string> claimed;
    for (const auto& sg : diagram.subgraphs) {
        const std::unordered_set<std::string> listed(sg.node_ids.begin(), sg.node_ids.end());
        Group g;
        g.subgraph = &sg;
        for (const auto& n : nodes) {
            if (!listed.count(n.id) || claimed.count(n.id)) continue;
            claimed.insert(n.id);
            g.members.push_back(&n);
        }
        if (g.members.empty()) {
            spdlog::debug("subgraph {} has no nodes of its own, skipping", sg.id);
            continue;
        }
        groups.push_back(std::move(g));
    }
    Group bare;
    for (const auto& n : nodes)
        if (!claimed.count(n.id)) bare.members.push_back(&n);
    if (!bare.members.empty()) groups.push_back(std::move(bare));
    return groups;
}

} // namespace

int node_box_width(const Node& node) {
    int width = text_metrics::multiline_width(node.label) + layout::box_padding;
    if (node.shape == Node::Shape::Circle) width += layout::circle_extra_padding;
    return width;
}

int node_box_height(const Node& node) {
    return 2 + text_metrics::line_count(node.label);
}

std::optional<PlacedDiagram> place_diagram(const diagram_model::GraphDiagram& diagram,
    std::optional<int> max_width, LayoutError* error)
{
    const std::vector<Node> nodes = collect_nodes(diagram);
    if (nodes.empty()) {
        if (error) *error = { LayoutErrorKind::EmptyDiagram, "no nodes found", 0 };
        return std::nullopt;
    }
    const std::vector<Group> groups = partition(nodes, diagram);
    spdlog::debug("graph layout: {} nodes in {} groups", nodes.size(), groups.size());

    const GraphSpacing defaults = default_spacing(diagram.direction);
    PlacedDiagram placed = layout_with_spacing(groups, diagram, defaults);
    if (!max_width || placed.width <= *max_width) return placed;

    if (!diagram.subgraphs.empty()) {
        if (error) {
            *error = { LayoutErrorKind::UnsupportedShape,
                "diagram with subgraphs is " + std::to_string(placed.width)
                    + " columns wide, exceeding max width " + std::to_string(*max_width)
                    + " (gap reduction is not attempted for subgraphs)",
                placed.width };
        }
        return std::nullopt;
    }

    const bool top_down = diagram.direction == Direction::TopDown;
    const int start = std::max(layout::graph::td_node_gap, layout::graph::lr_rank_gap);
    for (int gap = start; gap >= 1; --gap) {
        GraphSpacing spacing = defaults;
        if (top_down)
            spacing.node_gap = std::min(defaults.node_gap, gap);
        else
            spacing.rank_gap = std::min(defaults.rank_gap, gap);
        placed = layout_with_spacing(groups, diagram, spacing);
        spdlog::debug("graph layout: gap {} gives width {}", gap, placed.width);
        if (placed.width <= *max_width) return placed;
    }

    if (error) {
        *error = { LayoutErrorKind::InfeasibleWidth,
            "diagram too wide: needs at least " + std::to_string(placed.width)
                + " columns but max width is " + std::to_string(*max_width),
            placed.width };
    }
    return std::nullopt;
}

} // namespace diagram_placement
