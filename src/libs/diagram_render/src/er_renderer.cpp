#include <diagram_render/renderer.hpp>
#include <diagram_render/shapes.hpp>
#include <diagram_placement/connection_lines.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <text_metrics/text_metrics.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace diagram_render {

namespace {

using diagram_model::Cardinality;
using diagram_placement::GridPoint;
using diagram_placement::PlacedEntity;

// Crow's-foot notation, read with the entity box on the outside.
const char* left_symbol(Cardinality c) {
    switch (c) {
    case Cardinality::ExactlyOne: return "||";
    case Cardinality::ZeroOrOne: return "|o";
    case Cardinality::OneOrMany: return "}|";
    case Cardinality::ZeroOrMany: return "}o";
    }
    return "||";
}

const char* right_symbol(Cardinality c) {
    switch (c) {
    case Cardinality::ExactlyOne: return "||";
    case Cardinality::ZeroOrOne: return "o|";
    case Cardinality::OneOrMany: return "|{";
    case Cardinality::ZeroOrMany: return "o{";
    }
    return "||";
}

void draw_entity(canvas::DiagramCanvas& canvas, const PlacedEntity& entity) {
    const auto& r = entity.rect;
    draw_border(canvas, r, square_border);
    const int inset = diagram_placement::layout::label_inset;
    canvas.write(r.y + 1, r.x + inset, entity.name);
    if (entity.attribute_rows.empty()) return;

    const int separator = r.y + 2;
    canvas.set(separator, r.x, U'├');
    for (int col = r.x + 1; col < r.right(); ++col) canvas.set(separator, col, U'─');
    canvas.set(separator, r.right(), U'┤');
    for (std::size_t i = 0; i < entity.attribute_rows.size(); ++i)
        canvas.write(separator + 1 + static_cast<int>(i), r.x + inset, entity.attribute_rows[i]);
}

struct Mark {
    std::string text;
    std::vector<GridPoint> spots; // best first
};

// Lines go down first; crow's-foot symbols and then labels are written over
// them. Relationships meeting one side of an entity share its attach point,
// where the first symbol written stays. Labels never cover an entity, a
// symbol or another label.
class RelationshipPainter {
public:
    RelationshipPainter(canvas::DiagramCanvas& canvas, const diagram_placement::PlacedErDiagram& placed)
        : canvas_(canvas), placed_(placed)
    {
    }

    void paint() {
        for (const auto& r : placed_.relationships) draw_line(r);
        place(symbols_);
        place(labels_);
    }

private:
    bool inside_entity(int row, int col) const {
        for (const auto& e : placed_.entities)
            if (e.rect.contains(col, row)) return true;
        return false;
    }

    void draw_line(const diagram_placement::PlacedRelationship& rel) {
        const PlacedEntity* from = placed_.find_entity(rel.from);
        const PlacedEntity* to = placed_.find_entity(rel.to);
        if (!from || !to) return;
        Cardinality left = rel.left_cardinality;
        Cardinality right = rel.right_cardinality;
        if (to->rect.x < from->rect.x) {
            std::swap(from, to);
            std::swap(left, right);
        }
        if (to->rect.x <= from->rect.right()) {
            spdlog::debug("skipping relationship {} -> {} between entities of one rank", rel.from, rel.to);
            return;
        }

        const LineGlyphs glyphs = rel.identifying ? LineGlyphs{ U'─', U'│' } : LineGlyphs{ U'╌', U'┊' };
        const int from_right = from->rect.right() + 1;
        const int to_left = to->rect.x;
        const GridPoint start{ from_right, from->center_y };
        const GridPoint end{ to_left - 1, to->center_y };
        const int bend = from_right + (to_left - from_right) / 2;
        const auto blocked = [this](int row, int col) { return inside_entity(row, col); };
        draw_polyline(canvas_, rel.detour.empty() ? diagram_placement::orthogonal_route(start, end, bend) : rel.detour,
            glyphs, blocked);
        symbols_.push_back({ left_symbol(left), { start } });
        symbols_.push_back({ right_symbol(right), { { to_left - 2, end.row } } });

        if (rel.label.empty()) return;
        const int width = text_metrics::display_width(rel.label);
        if (!rel.detour.empty()) {
            // above the lane
            int lane = 0;
            for (const auto& p : rel.detour) lane = std::max(lane, p.row);
            int lo = to_left;
            int hi = from_right;
            for (const auto& p : rel.detour) {
                if (p.row != lane) continue;
                lo = std::min(lo, p.col);
                hi = std::max(hi, p.col);
            }
            labels_.push_back({ rel.label, { { lo + 1 + std::max(0, (hi - lo - 1 - width) / 2), lane - 1 } } });
            return;
        }
        const int gap = to_left - from_right;
        const int col = from_right + std::max(0, (gap - width) / 2);
        if (start.row == end.row) {
            if (gap > width) labels_.push_back({ rel.label, { { col, start.row }, { col, start.row - 1 } } });
            return;
        }
        // L route: beside the source segment on the side away from the bend,
        // else beside the target segment
        const int down = end.row > start.row ? 1 : -1;
        labels_.push_back({ rel.label, { { col, start.row - down }, { col, end.row + down } } });
    }

    bool fits(const GridPoint& at, int width) const {
        for (int col = at.col; col < at.col + width; ++col) {
            if (at.row < 0 || col < 0 || at.row >= canvas_.height() || col >= canvas_.width()) return false;
            if (inside_entity(at.row, col) || taken_.count({ at.row, col })) return false;
        }
        return true;
    }

    void place(const std::vector<Mark>& marks) {
        for (const auto& m : marks) {
            const int width = text_metrics::display_width(m.text);
            const auto spot = std::find_if(m.spots.begin(), m.spots.end(),
                [&](const GridPoint& at) { return fits(at, width); });
            if (spot == m.spots.end()) {
                spdlog::debug("no room for '{}' on a relationship line", m.text);
                continue;
            }
            canvas_.write(spot->row, spot->col, m.text);
            for (int col = spot->col; col < spot->col + width; ++col) taken_.insert({ spot->row, col });
        }
    }

    canvas::DiagramCanvas& canvas_;
    const diagram_placement::PlacedErDiagram& placed_;
    std::vector<Mark> symbols_;
    std::vector<Mark> labels_;
    std::set<std::pair<int, int>> taken_; // (row, col) under a symbol or label
};

} // namespace

void draw_er_diagram(canvas::DiagramCanvas& canvas, const diagram_placement::PlacedErDiagram& placed) {
    for (const auto& e : placed.entities) draw_entity(canvas, e);
    RelationshipPainter(canvas, placed).paint();
}

std::string render_er_diagram(const diagram_placement::PlacedErDiagram& placed) {
    canvas::DiagramCanvas canvas(placed.width, placed.height);
    draw_er_diagram(canvas, placed);
    return canvas.render();
}

} // namespace diagram_render
