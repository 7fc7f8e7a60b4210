#include <canvas/canvas.hpp>
#include <text_metrics/text_metrics.hpp>
#include <algorithm>

namespace canvas {

namespace {

using connect::down;
using connect::left;
using connect::right;
using connect::up;

struct GlyphMask {
    char32_t glyph;
    unsigned mask;
};

const GlyphMask glyph_masks[] = {
    { U'─', left | right }, { U'━', left | right }, { U'═', left | right },
    { U'╌', left | right }, { U'╍', left | right }, { U'┄', left | right },
    { U'┅', left | right }, { U'┈', left | right }, { U'┉', left | right },
    { U'│', up | down }, { U'┃', up | down }, { U'║', up | down },
    { U'┊', up | down }, { U'┋', up | down }, { U'┆', up | down },
    { U'┇', up | down }, { U'╎', up | down }, { U'╏', up | down },
    { U'┌', right | down }, { U'╭', right | down },
    { U'┐', left | down }, { U'╮', left | down },
    { U'└', right | up }, { U'╰', right | up },
    { U'┘', left | up }, { U'╯', left | up },
    { U'├', up | down | right }, { U'┤', up | down | left },
    { U'┬', left | right | down }, { U'┴', left | right | up },
    { U'┼', left | right | up | down },
};

} // namespace

unsigned connection_mask(char32_t glyph) {
    for (const auto& gm : glyph_masks)
        if (gm.glyph == glyph) return gm.mask;
    return 0;
}

char32_t connection_glyph(unsigned mask) {
    switch (mask & (left | right | up | down)) {
    case left:
    case right:
    case left | right: return U'─';
    case up:
    case down:
    case up | down: return U'│';
    case right | down: return U'┌';
    case left | down: return U'┐';
    case right | up: return U'└';
    case left | up: return U'┘';
    case up | down | right: return U'├';
    case up | down | left: return U'┤';
    case left | right | down: return U'┬';
    case left | right | up: return U'┴';
    case left | right | up | down: return U'┼';
    default: return U'\0';
    }
}

DiagramCanvas::DiagramCanvas(int width, int height)
    : width_(std::max(width, 0))
    , height_(std::max(height, 0))
    , cells_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_))
{
}

bool DiagramCanvas::in_bounds(int row, int col) const {
    return row >= 0 && col >= 0 && row < height_ && col < width_;
}

// Blanks the halves of any wide glyph that would be split by writing (row, col).
void DiagramCanvas::clear_fragments(int row, int col) {
    const Cell& target = at(row, col);
    if (target.kind == CellKind::Continuation && col > 0 && at(row, col - 1).kind == CellKind::Glyph)
        at(row, col - 1) = Cell{};
    if (target.kind == CellKind::Glyph && text_metrics::char_width(target.glyph) > 1
        && col + 1 < width_ && at(row, col + 1).kind == CellKind::Continuation)
        at(row, col + 1) = Cell{};
}

void DiagramCanvas::place_continuation(int row, int col) {
    if (!in_bounds(row, col)) return;
    const Cell& target = at(row, col);
    if (target.kind == CellKind::Glyph && text_metrics::char_width(target.glyph) > 1
        && col + 1 < width_ && at(row, col + 1).kind == CellKind::Continuation)
        at(row, col + 1) = Cell{};
    at(row, col) = Cell{ CellKind::Continuation, U'\0' };
}

void DiagramCanvas::set(int row, int col, char32_t ch) {
    if (!in_bounds(row, col)) return;
    clear_fragments(row, col);
    at(row, col) = Cell{ CellKind::Glyph, ch };
}

void DiagramCanvas::write(int row, int col, std::string_view text) {
    int offset = 0;
    for (const char32_t cp : text_metrics::decode_utf8(text)) {
        const int w = text_metrics::char_width(cp);
        if (w == 0) continue;
        set(row, col + offset, cp);
        for (int j = 1; j < w; ++j) place_continuation(row, col + offset + j);
        offset += w;
    }
}

void DiagramCanvas::merge(int row, int col, char32_t ch) {
    if (!in_bounds(row, col)) return;
    const Cell existing = at(row, col);
    if (existing.kind != CellKind::Glyph) {
        set(row, col, ch);
        return;
    }
    if (existing.glyph == ch) return;
    const unsigned existing_mask = connection_mask(existing.glyph);
    const unsigned incoming_mask = connection_mask(ch);
    if (existing_mask == 0 || incoming_mask == 0) {
        set(row, col, ch);
        return;
    }
    const char32_t joined = connection_glyph(existing_mask | incoming_mask);
    set(row, col, joined != U'\0' ? joined : ch);
}

Cell DiagramCanvas::cell(int row, int col) const {
    if (!in_bounds(row, col)) return Cell{};
    return at(row, col);
}

char32_t DiagramCanvas::glyph_at(int row, int col) const {
    const Cell c = cell(row, col);
    return c.kind == CellKind::Glyph ? c.glyph : U' ';
}

std::string DiagramCanvas::render() const {
    std::string out;
    for (int row = 0; row < height_; ++row) {
        std::string line;
        for (int col = 0; col < width_; ++col) {
            const Cell& c = at(row, col);
            if (c.kind == CellKind::Continuation) continue;
            if (c.kind == CellKind::Blank) {
                line += ' ';
                continue;
            }
            text_metrics::append_utf8(line, c.glyph);
        }
        const auto end = line.find_last_not_of(' ');
        line.erase(end == std::string::npos ? 0 : end + 1);
        if (row > 0) out += '\n';
        out += line;
    }
    return out;
}

} // namespace canvas
