#include <diagram_render/shapes.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <text_metrics/text_metrics.hpp>
#include <algorithm>
#include <map>

namespace diagram_render {

namespace {

using diagram_placement::GridPoint;

struct CellKey {
    int row;
    int col;
    bool operator<(const CellKey& o) const { return row != o.row ? row < o.row : col < o.col; }
};

int step_toward(int from, int to) {
    return from < to ? 1 : (from > to ? -1 : 0);
}

} // namespace

void draw_border(canvas::DiagramCanvas& canvas, const diagram_placement::Rect& rect,
    const BorderGlyphs& glyphs, bool clear_interior)
{
    if (rect.width < 2 || rect.height < 2) return;
    const int right = rect.right();
    const int bottom = rect.bottom();
    for (int col = rect.x + 1; col < right; ++col) {
        canvas.set(rect.y, col, glyphs.horizontal);
        canvas.set(bottom, col, glyphs.horizontal);
    }
    for (int row = rect.y + 1; row < bottom; ++row) {
        canvas.set(row, rect.x, glyphs.vertical);
        canvas.set(row, right, glyphs.vertical);
        if (clear_interior)
            for (int col = rect.x + 1; col < right; ++col) canvas.set(row, col, U' ');
    }
    canvas.set(rect.y, rect.x, glyphs.top_left);
    canvas.set(rect.y, right, glyphs.top_right);
    canvas.set(bottom, rect.x, glyphs.bottom_left);
    canvas.set(bottom, right, glyphs.bottom_right);
}

void draw_label(canvas::DiagramCanvas& canvas, const diagram_placement::Rect& rect,
    const std::string& label, bool centered)
{
    const auto lines = text_metrics::split_lines(label);
    const int interior = rect.height - 2;
    const int top = rect.y + 1 + std::max(0, (interior - static_cast<int>(lines.size())) / 2);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        int col = rect.x + diagram_placement::layout::label_inset;
        if (centered) {
            const int inner = rect.width - 2;
            col = rect.x + 1 + std::max(0, (inner - text_metrics::display_width(lines[i])) / 2);
        }
        canvas.write(top + static_cast<int>(i), col, lines[i]);
    }
}

void draw_polyline(canvas::DiagramCanvas& canvas, const std::vector<GridPoint>& points,
    const LineGlyphs& glyphs, const std::function<bool(int, int)>& blocked,
    unsigned extra_start, unsigned extra_end)
{
    if (points.empty()) return;
    std::map<CellKey, unsigned> masks;
    masks[{ points.front().row, points.front().col }] |= extra_start;
    masks[{ points.back().row, points.back().col }] |= extra_end;

    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        const GridPoint a = points[i];
        const GridPoint b = points[i + 1];
        const int dc = step_toward(a.col, b.col);
        const int dr = step_toward(a.row, b.row);
        if (dc == 0 && dr == 0) continue;
        unsigned forward = 0;
        unsigned backward = 0;
        if (dc > 0) { forward = canvas::connect::right; backward = canvas::connect::left; }
        if (dc < 0) { forward = canvas::connect::left; backward = canvas::connect::right; }
        if (dr > 0) { forward = canvas::connect::down; backward = canvas::connect::up; }
        if (dr < 0) { forward = canvas::connect::up; backward = canvas::connect::down; }
        for (GridPoint p = a;; p = { p.col + dc, p.row + dr }) {
            unsigned& mask = masks[{ p.row, p.col }];
            if (!(p == a)) mask |= backward;
            if (!(p == b)) mask |= forward;
            if (p == b) break;
        }
    }

    const unsigned horizontal = canvas::connect::left | canvas::connect::right;
    const unsigned vertical = canvas::connect::up | canvas::connect::down;
    for (const auto& [cell, mask] : masks) {
        if (mask == 0) continue;
        if (blocked && blocked(cell.row, cell.col)) continue;
        char32_t glyph = canvas::connection_glyph(mask);
        if ((mask & vertical) == 0) glyph = glyphs.horizontal;
        else if ((mask & horizontal) == 0) glyph = glyphs.vertical;
        canvas.merge(cell.row, cell.col, glyph);
    }
}

} // namespace diagram_render
