#include <diagram_placement/lanes.hpp>
#include <algorithm>
#include <cstdlib>
#include <utility>

namespace diagram_placement {

LaneRouter::LaneRouter(std::vector<Rect> boxes, std::vector<Rect> frames)
    : boxes_(std::move(boxes)), frames_(std::move(frames))
{
}

bool LaneRouter::column_clear_below(int col, int row) const {
    for (const auto& b : boxes_)
        if (col >= b.x && col <= b.right() && b.bottom() >= row) return false;
    return true;
}

bool LaneRouter::row_clear_right(int row, int col) const {
    for (const auto& b : boxes_)
        if (row >= b.y && row <= b.bottom() && b.right() >= col) return false;
    return true;
}

bool LaneRouter::frame_border_row(int row, int col) const {
    for (const auto& f : frames_)
        if ((row == f.y || row == f.bottom()) && f.right() >= col) return true;
    return false;
}

// Moves `at` past any taken lane that runs within one cell of it.
int LaneRouter::separate(int at, int lo, int hi, const std::vector<Lane>& taken) {
    for (bool moved = true; moved;) {
        moved = false;
        for (const auto& t : taken) {
            if (t.hi < lo || t.lo > hi || std::abs(t.at - at) >= 2) continue;
            at = t.at + 2;
            moved = true;
        }
    }
    return at;
}

std::vector<GridPoint> LaneRouter::route_below(GridPoint from, GridPoint to, int exit_inset, int approach_inset) {
    const int first_exit = from.col + exit_inset;
    const int last_approach = to.col - approach_inset;

    int exit_col = first_exit;
    for (int col = first_exit; col < last_approach; ++col) {
        if (!column_clear_below(col, from.row)) continue;
        exit_col = col;
        break;
    }
    int approach_col = last_approach;
    for (int col = last_approach; col > exit_col; --col) {
        if (!column_clear_below(col, to.row)) continue;
        approach_col = col;
        break;
    }

    int deepest = std::max(from.row, to.row);
    for (const auto* rects : { &boxes_, &frames_ })
        for (const auto& r : *rects)
            if (r.x <= approach_col && r.right() >= exit_col) deepest = std::max(deepest, r.bottom());
    const int lane = separate(deepest + 2, exit_col, approach_col, below_);
    below_.push_back({ lane, exit_col, approach_col });

    return without_repeats({ from, { exit_col, from.row }, { exit_col, lane }, { approach_col, lane },
        { approach_col, to.row }, to });
}

std::vector<GridPoint> LaneRouter::route_beside(GridPoint from, GridPoint to) {
    int exit_row = from.row;
    for (int row = from.row; row < to.row; ++row) {
        if (!row_clear_right(row, from.col) || frame_border_row(row, from.col)) continue;
        exit_row = row;
        break;
    }
    int approach_row = to.row - 1;
    for (int row = to.row - 1; row > exit_row; --row) {
        if (!row_clear_right(row, to.col) || frame_border_row(row, to.col)) continue;
        approach_row = row;
        break;
    }

    int widest = std::max(from.col, to.col);
    for (const auto* rects : { &boxes_, &frames_ })
        for (const auto& r : *rects)
            if (r.y <= approach_row && r.bottom() >= exit_row) widest = std::max(widest, r.right());
    const int lane = separate(widest + 2, exit_row, approach_row, beside_);
    beside_.push_back({ lane, exit_row, approach_row });

    return without_repeats({ from, { from.col, exit_row }, { lane, exit_row }, { lane, approach_row },
        { to.col, approach_row }, to });
}

} // namespace diagram_placement
