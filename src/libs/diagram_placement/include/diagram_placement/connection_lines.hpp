#pragma once

#include <vector>

namespace diagram_placement {

struct GridPoint {
    int col = 0;
    int row = 0;
};

inline bool operator==(const GridPoint& a, const GridPoint& b) {
    return a.col == b.col && a.row == b.row;
}

// Drops consecutive duplicate points.
std::vector<GridPoint> without_repeats(const std::vector<GridPoint>& points);

// Horizontal-first route: along from.row to bend_col, vertically to to.row,
// then along to.row. Straight when the rows match.
std::vector<GridPoint> orthogonal_route(GridPoint from, GridPoint to, int bend_col);

// Vertical-first route: down from.col to bend_row, across, then down to.col.
std::vector<GridPoint> vertical_route(GridPoint from, GridPoint to, int bend_row);

} // namespace diagram_placement
