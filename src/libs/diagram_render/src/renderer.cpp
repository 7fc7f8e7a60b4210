#include <diagram_render/renderer.hpp>
#include <diagram_render/shapes.hpp>
#include <diagram_placement/connection_lines.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <diagram_model/types.hpp>
#include <text_metrics/text_metrics.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <climits>
#include <functional>
#include <map>
#include <set>
#include <utility>

namespace diagram_render {

namespace {

using diagram_model::EdgeStyle;
using diagram_placement::GridPoint;
using diagram_placement::PlacedEdge;
using diagram_placement::PlacedNode;

const char32_t arrow_down = U'▼';
const char32_t arrow_right = U'>';

LineGlyphs line_glyphs(EdgeStyle style) {
    switch (style) {
    case EdgeStyle::DottedArrow:
    case EdgeStyle::DottedLink: return { U'╌', U'┊' };
    case EdgeStyle::ThickArrow:
    case EdgeStyle::ThickLink: return { U'═', U'║' };
    default: return { U'─', U'│' };
    }
}

void draw_node(canvas::DiagramCanvas& canvas, const PlacedNode& node) {
    switch (node.shape) {
    case diagram_model::Node::Shape::Round:
    case diagram_model::Node::Shape::Circle:
        draw_border(canvas, node.rect, rounded_border);
        draw_label(canvas, node.rect, node.label, true);
        break;
    case diagram_model::Node::Shape::Diamond:
        draw_border(canvas, node.rect, diamond_border);
        draw_label(canvas, node.rect, node.label);
        break;
    case diagram_model::Node::Shape::Box:
        draw_border(canvas, node.rect, square_border);
        draw_label(canvas, node.rect, node.label);
        break;
    }
}

// ┌─ Title ───┐
void draw_subgraph(canvas::DiagramCanvas& canvas, const diagram_placement::PlacedSubgraph& sg) {
    draw_border(canvas, sg.rect, square_border);
    canvas.set(sg.rect.y, sg.rect.x + 2, U' ');
    canvas.write(sg.rect.y, sg.rect.x + 3, sg.label);
    canvas.set(sg.rect.y, sg.rect.x + 3 + text_metrics::display_width(sg.label), U' ');
}

struct RoutedEdge {
    const PlacedEdge* edge = nullptr;
    const PlacedNode* from = nullptr;
    const PlacedNode* to = nullptr;
};

// Lines are merged first; arrowheads and then labels go on top once every
// line is down. A label takes the first of its spots that stays clear of
// nodes, subgraph borders, arrowheads and other labels.
class GraphEdgePainter {
public:
    GraphEdgePainter(canvas::DiagramCanvas& canvas, const diagram_placement::PlacedDiagram& placed)
        : canvas_(canvas), placed_(placed)
    {
    }

    void paint() {
        const bool top_down = placed_.direction == diagram_model::Direction::TopDown;
        std::vector<RoutedEdge> edges;
        std::vector<RoutedEdge> detoured;
        for (const auto& e : placed_.placed_edges) {
            const PlacedNode* from = placed_.find_node(e.source_node_id);
            const PlacedNode* to = placed_.find_node(e.target_node_id);
            if (!from || !to) continue;
            if (from == to) {
                spdlog::debug("skipping self edge on {}", e.source_node_id);
                continue;
            }
            const bool forward = top_down ? to->rect.y > from->rect.bottom() : to->rect.x > from->rect.right();
            if (!forward) {
                spdlog::debug("skipping back edge {} -> {}", e.source_node_id, e.target_node_id);
                continue;
            }
            (e.detour.empty() ? edges : detoured).push_back({ &e, from, to });
        }
        if (top_down)
            paint_top_down(edges);
        else
            for (const auto& re : edges) paint_left_right(re);
        for (const auto& re : detoured) paint_detour(re, top_down);

        place_heads();
        place_labels();
    }

private:
    struct PendingHead {
        GridPoint at;
        char32_t glyph;
    };

    struct PendingLabel {
        std::string text;
        std::vector<GridPoint> spots; // best first
    };

    bool inside_node(int row, int col) const {
        for (const auto& n : placed_.placed_nodes)
            if (n.rect.contains(col, row)) return true;
        return false;
    }

    bool on_subgraph_border(int row, int col) const {
        for (const auto& sg : placed_.placed_subgraphs) {
            const auto& r = sg.rect;
            if (!r.contains(col, row)) continue;
            if (row == r.y || row == r.bottom() || col == r.x || col == r.right()) return true;
        }
        return false;
    }

    bool subgraph_border_row(int row) const {
        for (const auto& sg : placed_.placed_subgraphs)
            if (row == sg.rect.y || row == sg.rect.bottom()) return true;
        return false;
    }

    // "┌─ Title ─┐": lines pass the title text by
    bool on_subgraph_title(int row, int col) const {
        for (const auto& sg : placed_.placed_subgraphs) {
            const int first = sg.rect.x + 2;
            const int last = sg.rect.x + 3 + text_metrics::display_width(sg.label);
            if (row == sg.rect.y && col >= first && col <= last) return true;
        }
        return false;
    }

    std::function<bool(int, int)> blocked() const {
        return [this](int row, int col) { return inside_node(row, col) || on_subgraph_title(row, col); };
    }

    // Walks a horizontal run up from `row` off any subgraph border, no
    // higher than `lowest`.
    int clear_of_borders(int row, int lowest) const {
        while (row > lowest && subgraph_border_row(row)) --row;
        return row;
    }

    void vertical(int col, int from_row, int to_row, const LineGlyphs& glyphs) {
        if (to_row < from_row) return;
        draw_polyline(canvas_, { { col, from_row }, { col, to_row } }, glyphs, blocked(),
            canvas::connect::up, canvas::connect::down);
    }

    void arrow_into(const RoutedEdge& re) {
        const char32_t head = diagram_model::has_arrowhead(re.edge->style) ? arrow_down
                                                                           : line_glyphs(re.edge->style).vertical;
        heads_.push_back({ { re.to->center_x, re.to->rect.y - 1 }, head });
    }

    // Right of the arrowhead, or left of it when that is taken.
    void label_beside_head(const PlacedNode* target, const std::string& label) {
        const int row = target->rect.y - 1;
        const int width = text_metrics::display_width(label);
        labels_.push_back({ label, { { target->center_x + 2, row }, { target->center_x - 1 - width, row } } });
    }

    // Horizontal bar on `row` joining the given columns; up/down marks which
    // columns continue above or below it.
    void bar(int row, const std::set<int>& up_cols, const std::set<int>& down_cols) {
        std::set<int> cols = up_cols;
        cols.insert(down_cols.begin(), down_cols.end());
        const int lo = *cols.begin();
        const int hi = *cols.rbegin();
        for (int col = lo; col <= hi; ++col) {
            unsigned mask = 0;
            if (col > lo) mask |= canvas::connect::left;
            if (col < hi) mask |= canvas::connect::right;
            if (up_cols.count(col)) mask |= canvas::connect::up;
            if (down_cols.count(col)) mask |= canvas::connect::down;
            if (on_subgraph_title(row, col)) continue;
            canvas_.merge(row, col, canvas::connection_glyph(mask));
        }
    }

    void paint_top_down(const std::vector<RoutedEdge>& edges) {
        std::map<const PlacedNode*, std::vector<const RoutedEdge*>> outgoing;
        std::vector<const PlacedNode*> source_order;
        for (const auto& re : edges) {
            if (outgoing[re.from].empty()) source_order.push_back(re.from);
            outgoing[re.from].push_back(&re);
            canvas_.merge(re.from->rect.bottom(), re.from->center_x, U'┬');
        }

        std::map<const PlacedNode*, std::vector<const RoutedEdge*>> incoming;
        std::vector<const PlacedNode*> target_order;
        for (const PlacedNode* source : source_order) {
            const auto& out = outgoing[source];
            if (out.size() > 1) {
                paint_fan_out(source, out);
                continue;
            }
            const RoutedEdge* re = out.front();
            if (incoming[re->to].empty()) target_order.push_back(re->to);
            incoming[re->to].push_back(re);
        }
        for (const PlacedNode* target : target_order) {
            const auto& in = incoming[target];
            if (in.size() > 1)
                paint_fan_in(target, in);
            else
                paint_single(*in.front());
        }
    }

    void paint_fan_out(const PlacedNode* source, const std::vector<const RoutedEdge*>& out) {
        const int from_below = source->rect.bottom() + 1;
        int bar_row = INT_MAX;
        for (const auto* re : out) bar_row = std::min(bar_row, re->to->rect.y - 2);
        bar_row = clear_of_borders(std::max(bar_row, from_below), from_below);

        const LineGlyphs glyphs = line_glyphs(out.front()->edge->style);
        vertical(source->center_x, from_below, bar_row - 1, glyphs);
        std::set<int> children;
        for (const auto* re : out) children.insert(re->to->center_x);
        bar(bar_row, { source->center_x }, children);

        for (const auto* re : out) {
            vertical(re->to->center_x, bar_row + 1, re->to->rect.y - 2, line_glyphs(re->edge->style));
            arrow_into(*re);
            if (!re->edge->label.empty()) label_beside_head(re->to, re->edge->label);
        }
    }

    void paint_fan_in(const PlacedNode* target, const std::vector<const RoutedEdge*>& in) {
        const int to_above = target->rect.y - 1;
        int lowest = 0;
        for (const auto* re : in) lowest = std::max(lowest, re->from->rect.bottom() + 1);
        const int bar_row = clear_of_borders(std::max(to_above - 1, lowest), lowest);

        std::set<int> parents;
        std::string labels;
        for (const auto* re : in) {
            parents.insert(re->from->center_x);
            vertical(re->from->center_x, re->from->rect.bottom() + 1, bar_row - 1, line_glyphs(re->edge->style));
            if (!re->edge->label.empty()) labels += (labels.empty() ? "" : ", ") + re->edge->label;
        }
        bar(bar_row, parents, { target->center_x });
        vertical(target->center_x, bar_row + 1, to_above - 1, line_glyphs(in.front()->edge->style));
        arrow_into(*in.front());
        if (!labels.empty()) label_beside_head(target, labels);
    }

    void paint_single(const RoutedEdge& re) {
        const LineGlyphs glyphs = line_glyphs(re.edge->style);
        const int from_below = re.from->rect.bottom() + 1;
        const int to_above = re.to->rect.y - 1;
        const std::string& label = re.edge->label;

        if (re.from->center_x == re.to->center_x) {
            vertical(re.from->center_x, from_below, to_above - 1, glyphs);
            arrow_into(re);
            if (label.empty()) return;
            // preferably across the line just above the arrowhead
            const int width = text_metrics::display_width(label);
            labels_.push_back({ label, { { std::max(0, re.from->center_x - width / 2), to_above - 1 },
                { re.to->center_x + 2, to_above }, { re.to->center_x - 1 - width, to_above } } });
            return;
        }

        const int bend_row = clear_of_borders(std::max(from_below, to_above - 1), from_below);
        const auto route = diagram_placement::vertical_route({ re.from->center_x, from_below },
            { re.to->center_x, bend_row }, bend_row);
        draw_polyline(canvas_, route, glyphs, blocked(), canvas::connect::up, canvas::connect::down);
        vertical(re.to->center_x, bend_row + 1, to_above - 1, glyphs);
        arrow_into(re);
        if (!label.empty()) label_beside_head(re.to, label);
    }

    void paint_left_right(const RoutedEdge& re) {
        const LineGlyphs glyphs = line_glyphs(re.edge->style);
        const int from_right = re.from->rect.right() + 1;
        const int to_left = re.to->rect.x;
        const GridPoint start{ from_right, re.from->center_y };
        const GridPoint end{ to_left - 1, re.to->center_y };
        const int bend = from_right + (to_left - from_right) / 2;
        draw_polyline(canvas_, diagram_placement::orthogonal_route(start, end, bend), glyphs, blocked());
        heads_.push_back({ end, diagram_model::has_arrowhead(re.edge->style) ? arrow_right : glyphs.horizontal });

        const std::string& label = re.edge->label;
        if (label.empty()) return;
        const int width = text_metrics::display_width(label);
        auto centred = [width](int lo, int hi) { return lo + std::max(0, (hi - lo - width) / 2); };
        if (start.row == end.row) {
            const int col = centred(from_right, to_left);
            labels_.push_back({ label, { { col, start.row - 1 }, { col, start.row + 1 } } });
            return;
        }
        // L route: above the target-side run, where fan-out siblings part
        const int target_side = centred(bend + 1, to_left);
        labels_.push_back({ label, { { target_side, end.row - 1 }, { centred(from_right, bend), start.row - 1 },
            { target_side, end.row + 1 } } });
    }

    void paint_detour(const RoutedEdge& re, bool top_down) {
        const auto& route = re.edge->detour;
        const LineGlyphs glyphs = line_glyphs(re.edge->style);
        if (top_down) {
            canvas_.merge(re.from->rect.bottom(), re.from->center_x, U'┬');
            draw_polyline(canvas_, route, glyphs, blocked(), canvas::connect::up, canvas::connect::down);
            arrow_into(re);
            if (!re.edge->label.empty()) label_beside_head(re.to, re.edge->label);
            return;
        }

        draw_polyline(canvas_, route, glyphs, blocked(), canvas::connect::left, canvas::connect::right);
        heads_.push_back({ route.back(),
            diagram_model::has_arrowhead(re.edge->style) ? arrow_right : glyphs.horizontal });
        const std::string& label = re.edge->label;
        if (label.empty()) return;
        // above the lane, the lowest run of the route
        int lane = 0;
        for (const auto& p : route) lane = std::max(lane, p.row);
        int lo = INT_MAX;
        int hi = INT_MIN;
        for (const auto& p : route) {
            if (p.row != lane) continue;
            lo = std::min(lo, p.col);
            hi = std::max(hi, p.col);
        }
        const int width = text_metrics::display_width(label);
        labels_.push_back({ label, { { lo + 1 + std::max(0, (hi - lo - 1 - width) / 2), lane - 1 } } });
    }

    bool label_fits(const GridPoint& at, int width) const {
        for (int col = at.col; col < at.col + width; ++col) {
            if (at.row < 0 || col < 0 || at.row >= canvas_.height() || col >= canvas_.width()) return false;
            if (inside_node(at.row, col) || on_subgraph_border(at.row, col)) return false;
            if (taken_.count({ at.row, col })) return false;
        }
        return true;
    }

    void place_heads() {
        for (const auto& h : heads_) {
            if (on_subgraph_border(h.at.row, h.at.col)) {
                spdlog::debug("arrowhead at {},{} would cover a subgraph border, dropped", h.at.row, h.at.col);
                continue;
            }
            canvas_.set(h.at.row, h.at.col, h.glyph);
            taken_.insert({ h.at.row, h.at.col });
        }
    }

    void place_labels() {
        for (const auto& l : labels_) {
            const int width = text_metrics::display_width(l.text);
            const auto spot = std::find_if(l.spots.begin(), l.spots.end(),
                [&](const GridPoint& at) { return label_fits(at, width); });
            if (spot == l.spots.end()) {
                spdlog::warn("no room for edge label '{}'", l.text);
                continue;
            }
            canvas_.write(spot->row, spot->col, l.text);
            for (int col = spot->col; col < spot->col + width; ++col) taken_.insert({ spot->row, col });
        }
    }

    canvas::DiagramCanvas& canvas_;
    const diagram_placement::PlacedDiagram& placed_;
    std::vector<PendingHead> heads_;
    std::vector<PendingLabel> labels_;
    std::set<std::pair<int, int>> taken_; // (row, col) under a head or label
};

} // namespace

void draw_diagram(canvas::DiagramCanvas& canvas, const diagram_placement::PlacedDiagram& placed) {
    for (const auto& sg : placed.placed_subgraphs) draw_subgraph(canvas, sg);
    for (const auto& pn : placed.placed_nodes) draw_node(canvas, pn);
    GraphEdgePainter(canvas, placed).paint();
}

std::string render_diagram(const diagram_placement::PlacedDiagram& placed) {
    canvas::DiagramCanvas canvas(placed.width, placed.height);
    draw_diagram(canvas, placed);
    return canvas.render();
}

} // namespace diagram_render
