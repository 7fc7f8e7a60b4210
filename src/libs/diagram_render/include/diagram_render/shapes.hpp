#pragma once

#include <canvas/canvas.hpp>
#include <diagram_placement/connection_lines.hpp>
#include <diagram_placement/types.hpp>
#include <functional>
#include <string>
#include <vector>

namespace diagram_render {

struct BorderGlyphs {
    char32_t top_left;
    char32_t top_right;
    char32_t bottom_left;
    char32_t bottom_right;
    char32_t horizontal;
    char32_t vertical;
};

constexpr BorderGlyphs square_border{ U'┌', U'┐', U'└', U'┘', U'─', U'│' };
constexpr BorderGlyphs rounded_border{ U'╭', U'╮', U'╰', U'╯', U'─', U'│' };
constexpr BorderGlyphs diamond_border{ U'╱', U'╲', U'╲', U'╱', U'─', U'│' };

struct LineGlyphs {
    char32_t horizontal;
    char32_t vertical;
};

void draw_border(canvas::DiagramCanvas& canvas, const diagram_placement::Rect& rect,
    const BorderGlyphs& glyphs, bool clear_interior = false);

// Label lines centred vertically in the interior; left-aligned after the
// inset unless centered is set.
void draw_label(canvas::DiagramCanvas& canvas, const diagram_placement::Rect& rect,
    const std::string& label, bool centered = false);

// Orthogonal polyline merged into the canvas. Straight runs use the given
// glyphs, bends use light corners. extra_start / extra_end add connection
// directions at the end points (canvas::connect bits). Cells for which
// blocked returns true are left alone.
void draw_polyline(canvas::DiagramCanvas& canvas, const std::vector<diagram_placement::GridPoint>& points,
    const LineGlyphs& glyphs, const std::function<bool(int, int)>& blocked = {},
    unsigned extra_start = 0, unsigned extra_end = 0);

} // namespace diagram_render
