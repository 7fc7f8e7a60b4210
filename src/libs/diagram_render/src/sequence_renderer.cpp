#include <diagram_render/renderer.hpp>
#include <diagram_render/shapes.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <text_metrics/text_metrics.hpp>
#include <algorithm>

namespace diagram_render {

namespace {

using diagram_model::ArrowHead;
using diagram_model::LineStyle;
using diagram_placement::FrameEdge;
using diagram_placement::FrameRow;
using diagram_placement::MessageDirection;
using diagram_placement::MessageRow;
using diagram_placement::NoteRow;
using diagram_placement::PlacedSequence;

const char32_t lifeline_light = U'│';
const char32_t lifeline_heavy = U'┃';
const char32_t destroy_marker = U'●';

struct OpenFrame {
    int id = 0;
    int left = 0;
    int right = 0;
};

char32_t head_glyph(ArrowHead head, MessageDirection direction) {
    const bool ltr = direction == MessageDirection::LeftToRight;
    switch (head) {
    case ArrowHead::Arrowhead: return ltr ? U'>' : U'<';
    case ArrowHead::Cross: return U'x';
    case ArrowHead::Open: return ltr ? U')' : U'(';
    case ArrowHead::None: break;
    }
    return U'─';
}

// Solid lines are continuous, dotted ones alternate dash and gap from `origin`.
char32_t line_glyph(LineStyle style, int col, int origin) {
    if (style == LineStyle::Dotted && (col - origin) % 2 != 0) return U' ';
    return U'─';
}

class SequencePainter {
public:
    SequencePainter(canvas::DiagramCanvas& canvas, const PlacedSequence& placed)
        : canvas_(canvas), placed_(placed), alive_(placed.participants.size(), true)
    {
    }

    void paint() {
        draw_boxes(0, true);
        int y = placed_.box_height;
        for (std::size_t i = 0; i < placed_.rows.size(); ++i) {
            const auto& row = placed_.rows[i];
            const int h = diagram_placement::row_height(row);
            const auto& active = placed_.activations[i];
            if (const auto* m = std::get_if<MessageRow>(&row)) {
                draw_lifelines(y, h, active);
                if (m->is_self())
                    draw_self_message(*m, y);
                else
                    draw_message(*m, y);
                draw_frame_sides(y, h, -1);
            } else if (const auto* n = std::get_if<NoteRow>(&row)) {
                draw_lifelines(y, h, active);
                draw_note(*n, y);
                draw_frame_sides(y, h, -1);
            } else if (const auto* f = std::get_if<FrameRow>(&row)) {
                draw_frame_sides(y, 1, f->frame_id);
                draw_frame_edge(*f, y);
                if (f->edge == FrameEdge::Start) frames_.push_back({ f->frame_id, f->frame_left, f->frame_right });
                if (f->edge == FrameEdge::End) {
                    frames_.erase(std::remove_if(frames_.begin(), frames_.end(),
                                      [&](const OpenFrame& o) { return o.id == f->frame_id; }),
                        frames_.end());
                }
            } else if (const auto* d = std::get_if<diagram_placement::DestroyRow>(&row)) {
                draw_lifelines(y, h, active);
                canvas_.set(y, d->col, destroy_marker);
                alive_[static_cast<std::size_t>(d->participant_index)] = false;
                draw_frame_sides(y, h, -1);
            }
            y += h;
        }
        draw_boxes(y, false);
    }

private:
    void draw_boxes(int y, bool top) {
        for (std::size_t i = 0; i < placed_.participants.size(); ++i) {
            if (!top && placed_.destroyed[i]) continue;
            const auto& p = placed_.participants[i];
            const diagram_placement::Rect rect{ p.box_left, y, p.box_right - p.box_left + 1, placed_.box_height };
            draw_border(canvas_, rect, square_border);
            draw_label(canvas_, rect, p.name);
            if (top)
                canvas_.set(rect.bottom(), p.center_col, U'┬');
            else
                canvas_.set(rect.y, p.center_col, U'┴');
        }
    }

    void draw_lifelines(int y, int h, const std::vector<bool>& active) {
        for (std::size_t i = 0; i < placed_.participants.size(); ++i) {
            if (!alive_[i]) continue;
            const char32_t glyph = i < active.size() && active[i] ? lifeline_heavy : lifeline_light;
            for (int row = y; row < y + h; ++row) canvas_.set(row, placed_.participants[i].center_col, glyph);
        }
    }

    void write_lines(int y, int col, const std::string& text) {
        const auto lines = text_metrics::split_lines(text);
        for (std::size_t i = 0; i < lines.size(); ++i) canvas_.write(y + static_cast<int>(i), col, lines[i]);
    }

    void draw_message(const MessageRow& m, int y) {
        const int left = std::min(m.from_col, m.to_col);
        const int right = std::max(m.from_col, m.to_col);
        write_lines(y, left + diagram_placement::layout::label_inset, m.text);
        const int arrow_row = y + text_metrics::line_count(m.text);
        for (int col = left + 1; col < right; ++col)
            canvas_.set(arrow_row, col, line_glyph(m.arrow.line, col, left + 1));
        if (right - left < 2) return;
        if (m.direction == MessageDirection::LeftToRight) {
            canvas_.set(arrow_row, right - 1, head_glyph(m.arrow.head, m.direction));
        } else {
            canvas_.set(arrow_row, left + 1, head_glyph(m.arrow.head, m.direction));
            canvas_.set(arrow_row, right - 1, U'─');
        }
    }

    // Text beside the lifeline, then an arm out to the right and back:
    //   │ text
    //   │───┐
    //   │<──┘
    void draw_self_message(const MessageRow& m, int y) {
        const int center = m.from_col;
        const int arm_end = center + diagram_placement::layout::sequence::self_loop_arm;
        write_lines(y, center + diagram_placement::layout::label_inset, m.text);
        const int out_row = y + text_metrics::line_count(m.text);
        const int back_row = out_row + 1;
        // the return arm stays solid whatever the message line style
        for (int col = center + 1; col < arm_end; ++col) {
            canvas_.set(out_row, col, line_glyph(m.arrow.line, col, center + 1));
            canvas_.set(back_row, col, U'─');
        }
        canvas_.set(out_row, arm_end, U'┐');
        canvas_.set(back_row, arm_end, U'┘');
        canvas_.set(back_row, center + 1, head_glyph(m.arrow.head, MessageDirection::RightToLeft));
    }

    void draw_note(const NoteRow& n, int y) {
        const diagram_placement::Rect rect{ n.box_left, y, n.box_right - n.box_left + 1,
            2 + text_metrics::line_count(n.text) };
        draw_border(canvas_, rect, square_border, true);
        write_lines(y + 1, n.box_left + diagram_placement::layout::label_inset, n.text);
    }

    void draw_frame_edge(const FrameRow& f, int y) {
        char32_t left_glyph = U'┌';
        char32_t right_glyph = U'┐';
        if (f.edge == FrameEdge::Divider) {
            left_glyph = U'├';
            right_glyph = U'┤';
        } else if (f.edge == FrameEdge::End) {
            left_glyph = U'└';
            right_glyph = U'┘';
        }
        for (int col = f.frame_left + 1; col < f.frame_right; ++col) canvas_.set(y, col, U'─');
        canvas_.set(y, f.frame_left, left_glyph);
        canvas_.set(y, f.frame_right, right_glyph);

        const int label_col = f.frame_left + diagram_placement::layout::label_inset;
        canvas_.write(y, label_col, f.label);
        const int label_end = label_col + text_metrics::display_width(f.label);
        for (std::size_t i = 0; i < placed_.participants.size(); ++i) {
            if (!alive_[i]) continue;
            const int center = placed_.participants[i].center_col;
            if (center <= f.frame_left || center >= f.frame_right) continue;
            if (!f.label.empty() && center <= label_end) continue;
            canvas_.set(y, center, U'┼');
        }
    }

    // Left and right edges of every open frame except `skip_id`.
    void draw_frame_sides(int y, int h, int skip_id) {
        for (const auto& f : frames_) {
            if (f.id == skip_id) continue;
            for (int row = y; row < y + h; ++row) {
                canvas_.set(row, f.left, U'│');
                canvas_.set(row, f.right, U'│');
            }
        }
    }

    canvas::DiagramCanvas& canvas_;
    const PlacedSequence& placed_;
    std::vector<bool> alive_;
    std::vector<OpenFrame> frames_;
};

} // namespace

void draw_sequence_diagram(canvas::DiagramCanvas& canvas, const PlacedSequence& placed) {
    SequencePainter(canvas, placed).paint();
}

std::string render_sequence_diagram(const PlacedSequence& placed) {
    canvas::DiagramCanvas canvas(placed.content_width, placed.total_height);
    draw_sequence_diagram(canvas, placed);
    return canvas.render();
}

} // namespace diagram_render
