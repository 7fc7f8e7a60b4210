#include <diagram_placement/connection_lines.hpp>

namespace diagram_placement {

std::vector<GridPoint> without_repeats(const std::vector<GridPoint>& points) {
    std::vector<GridPoint> out;
    for (const auto& p : points)
        if (out.empty() || !(out.back() == p)) out.push_back(p);
    return out;
}

std::vector<GridPoint> orthogonal_route(GridPoint from, GridPoint to, int bend_col) {
    if (from.row == to.row) return without_repeats({ from, to });
    return without_repeats({ from, { bend_col, from.row }, { bend_col, to.row }, to });
}

std::vector<GridPoint> vertical_route(GridPoint from, GridPoint to, int bend_row) {
    if (from.col == to.col) return without_repeats({ from, to });
    return without_repeats({ from, { from.col, bend_row }, { to.col, bend_row }, to });
}

} // namespace diagram_placement
