#pragma once

#include <canvas/canvas.hpp>
#include <diagram_placement/er_placement.hpp>
#include <diagram_placement/sequence_placement.hpp>
#include <diagram_placement/types.hpp>
#include <string>

namespace diagram_render {

// Each renderer draws a finished layout onto a canvas sized from it.
void draw_diagram(canvas::DiagramCanvas& canvas, const diagram_placement::PlacedDiagram& placed);
void draw_er_diagram(canvas::DiagramCanvas& canvas, const diagram_placement::PlacedErDiagram& placed);
void draw_sequence_diagram(canvas::DiagramCanvas& canvas, const diagram_placement::PlacedSequence& placed);

std::string render_diagram(const diagram_placement::PlacedDiagram& placed);
std::string render_er_diagram(const diagram_placement::PlacedErDiagram& placed);
std::string render_sequence_diagram(const diagram_placement::PlacedSequence& placed);

} // namespace diagram_render
