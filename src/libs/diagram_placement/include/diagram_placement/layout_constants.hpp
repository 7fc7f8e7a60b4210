#pragma once

namespace diagram_placement {

// Shared layout constants (used by placers and renderers). All values in
// terminal columns or rows.

namespace layout {

// "│ " + " │" around a label.
constexpr int box_padding = 4;
constexpr int circle_extra_padding = 4;
constexpr int label_inset = 2;

namespace sequence {
constexpr int min_gap = 10;
constexpr int arrow_decoration_width = 2;
constexpr int message_label_margin = 2;
// Extra columns between the half-widths of two neighbouring participant boxes.
constexpr int box_half_padding = 2;
constexpr int box_separation = 2;
constexpr int self_loop_arm = 4;
// Room kept between a note box and the next lifeline.
constexpr int note_clearance = 3;
constexpr int note_offset = 2;
// Truncated participant names never get narrower than this.
constexpr int min_name_width = 2;
} // namespace sequence

namespace graph {
constexpr int td_rank_spacing = 2;
constexpr int td_node_gap = 3;
constexpr int lr_rank_gap = 5;
constexpr int lr_node_gap = 2;
constexpr int lr_label_margin = 2;
constexpr int subgraph_pad_left = 2;
constexpr int subgraph_pad_right = 2;
// Leaves a row inside the title border for an arrowhead.
constexpr int subgraph_pad_top = 2;
constexpr int subgraph_pad_bottom = 1;
// "┌─ " + title + " ─┐"
constexpr int subgraph_title_decoration = 6;
constexpr int td_group_gap = 2;
constexpr int lr_group_gap = 5;
} // namespace graph

namespace er {
constexpr int min_gap = 6;
constexpr int label_margin = 8;
constexpr int vertical_gap = 1;
} // namespace er

} // namespace layout
} // namespace diagram_placement
