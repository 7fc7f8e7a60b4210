#pragma once

#include <diagram_placement/connection_lines.hpp>
#include <diagram_placement/types.hpp>
#include <vector>

namespace diagram_placement {

// Routes for edges that jump over boxes lying between their ends. Such an
// edge leaves its source, runs along a lane clear of every box and frame in
// between, and comes back to its target. Lanes handed out by one router keep
// a blank row or column between each other.
class LaneRouter {
public:
    LaneRouter(std::vector<Rect> boxes, std::vector<Rect> frames);

    // Left to right. `from` is the first cell right of the source, `to` the
    // last cell before the target. The route turns down exit_inset columns
    // after `from`, runs along a lane below the boxes in between and comes
    // back up approach_inset columns before `to`.
    std::vector<GridPoint> route_below(GridPoint from, GridPoint to, int exit_inset, int approach_inset);

    // Top down. `from` is the cell under the source, `to` the cell above the
    // target. The lane runs down the right of the boxes in between.
    std::vector<GridPoint> route_beside(GridPoint from, GridPoint to);

private:
    struct Lane {
        int at = 0; // row of a horizontal lane, column of a vertical one
        int lo = 0;
        int hi = 0;
    };

    bool column_clear_below(int col, int row) const;
    bool row_clear_right(int row, int col) const;
    bool frame_border_row(int row, int col) const;
    static int separate(int at, int lo, int hi, const std::vector<Lane>& taken);

    std::vector<Rect> boxes_;
    std::vector<Rect> frames_;
    std::vector<Lane> below_;
    std::vector<Lane> beside_;
};

} // namespace diagram_placement
