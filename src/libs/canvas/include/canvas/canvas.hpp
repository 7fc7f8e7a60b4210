#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace canvas {

enum class CellKind { Blank, Glyph, Continuation };

struct Cell {
    CellKind kind = CellKind::Blank;
    char32_t glyph = U' ';
};

// Directions a box-drawing glyph connects to.
namespace connect {
constexpr unsigned left = 1;
constexpr unsigned right = 2;
constexpr unsigned up = 4;
constexpr unsigned down = 8;
} // namespace connect

// 0 when the glyph is not a recognised line, corner or junction.
unsigned connection_mask(char32_t glyph);
// Light glyph for a connection set, U'\0' for an empty mask.
char32_t connection_glyph(unsigned mask);

// Fixed-size grid of terminal cells. Wide characters occupy a glyph cell
// followed by continuation cells that are never printed.
class DiagramCanvas {
public:
    DiagramCanvas(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    // Out-of-range writes are ignored.
    void set(int row, int col, char32_t ch);
    void write(int row, int col, std::string_view text);
    void merge(int row, int col, char32_t ch);

    Cell cell(int row, int col) const;
    char32_t glyph_at(int row, int col) const;

    std::string render() const;

private:
    bool in_bounds(int row, int col) const;
    Cell& at(int row, int col) { return cells_[static_cast<std::size_t>(row * width_ + col)]; }
    const Cell& at(int row, int col) const { return cells_[static_cast<std::size_t>(row * width_ + col)]; }
    void clear_fragments(int row, int col);
    void place_continuation(int row, int col);

    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> cells_;
};

} // namespace canvas
