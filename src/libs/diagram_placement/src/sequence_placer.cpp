#include <diagram_placement/sequence_placement.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <text_metrics/text_metrics.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <climits>
#include <unordered_map>

namespace diagram_placement {

namespace {

using diagram_model::Statement;
namespace seq = layout::sequence;

class ParticipantTable {
public:
    // Registers id on first sight; later calls never rename it.
    int intern(const std::string& id, const std::string& name) {
        if (auto it = index_.find(id); it != index_.end()) return it->second;
        const int idx = static_cast<int>(ids_.size());
        ids_.push_back(id);
        names_.push_back(name);
        index_[id] = idx;
        return idx;
    }

    int index_of(const std::string& id) const {
        auto it = index_.find(id);
        return it == index_.end() ? -1 : it->second;
    }

    const std::vector<std::string>& ids() const { return ids_; }
    const std::vector<std::string>& names() const { return names_; }
    std::size_t size() const { return ids_.size(); }

private:
    std::vector<std::string> ids_;
    std::vector<std::string> names_;
    std::unordered_map<std::string, int> index_;
};

void collect_participants(const std::vector<Statement>& statements, ParticipantTable& table) {
    for (const auto& st : statements) {
        if (const auto* p = std::get_if<diagram_model::ParticipantDecl>(&st)) {
            table.intern(p->id, p->display_name());
        } else if (const auto* c = std::get_if<diagram_model::Create>(&st)) {
            table.intern(c->participant.id, c->participant.display_name());
        } else if (const auto* m = std::get_if<diagram_model::Message>(&st)) {
            table.intern(m->from, m->from);
            table.intern(m->to, m->to);
        } else if (const auto* n = std::get_if<diagram_model::Note>(&st)) {
            for (const auto& id : n->participants) table.intern(id, id);
        } else if (const auto* a = std::get_if<diagram_model::Activate>(&st)) {
            table.intern(a->id, a->id);
        } else if (const auto* d = std::get_if<diagram_model::Deactivate>(&st)) {
            table.intern(d->id, d->id);
        } else if (const auto* x = std::get_if<diagram_model::Destroy>(&st)) {
            table.intern(x->id, x->id);
        } else if (const auto* b = std::get_if<diagram_model::Block>(&st)) {
            collect_participants(b->body, table);
            for (const auto& br : b->branches) collect_participants(br.body, table);
        }
    }
}

bool contains_autonumber(const std::vector<Statement>& statements) {
    for (const auto& st : statements) {
        if (std::holds_alternative<diagram_model::AutoNumber>(st)) return true;
        if (const auto* b = std::get_if<diagram_model::Block>(&st)) {
            if (contains_autonumber(b->body)) return true;
            for (const auto& br : b->branches)
                if (contains_autonumber(br.body)) return true;
        }
    }
    return false;
}

// Rows before columns are known.
struct MessageSpec {
    int from = 0;
    int to = 0;
    std::string text;
    diagram_model::Arrow arrow;
};

struct NoteSpec {
    diagram_model::NotePlacement placement = diagram_model::NotePlacement::RightOf;
    int first = 0;
    int last = 0;
    std::string text;
};

struct FrameSpec {
    FrameEdge edge = FrameEdge::Start;
    int frame_id = 0;
    std::string label;
};

struct DestroySpec {
    int participant = 0;
};

using RowSpec = std::variant<MessageSpec, NoteSpec, FrameSpec, DestroySpec>;

struct FrameInfo {
    int parent = -1;
    int label_width = 0;
};

struct FlatSequence {
    std::vector<RowSpec> rows;
    std::vector<int> row_frames; // innermost open frame per row, -1 outside any
    std::vector<std::vector<bool>> activations;
    std::vector<bool> destroyed;
    std::vector<FrameInfo> frames;
};

struct WalkState {
    std::vector<int> depths;
    int message_counter = 0;
    bool autonumber = false;
    std::vector<int> open_frames;
};

void emit(FlatSequence& flat, const WalkState& state, RowSpec spec) {
    flat.rows.push_back(std::move(spec));
    flat.row_frames.push_back(state.open_frames.empty() ? -1 : state.open_frames.back());
    std::vector<bool> active(state.depths.size());
    for (std::size_t i = 0; i < state.depths.size(); ++i) active[i] = state.depths[i] > 0;
    flat.activations.push_back(std::move(active));
}

void deactivate(WalkState& state, int idx) {
    auto& depth = state.depths[static_cast<std::size_t>(idx)];
    depth = std::max(0, depth - 1);
}

std::string frame_label(const char* keyword, const std::string& label) {
    std::string out = keyword;
    if (!label.empty()) out += " " + label;
    return out;
}

void flatten(const std::vector<Statement>& statements, const ParticipantTable& table,
    WalkState& state, FlatSequence& flat)
{
    for (const auto& st : statements) {
        if (const auto* m = std::get_if<diagram_model::Message>(&st)) {
            MessageSpec spec;
            spec.from = table.index_of(m->from);
            spec.to = table.index_of(m->to);
            spec.arrow = m->arrow;
            spec.text = m->text;
            if (state.autonumber) spec.text = std::to_string(++state.message_counter) + ". " + m->text;
            if (m->activate_target) ++state.depths[static_cast<std::size_t>(spec.to)];
            const int from = spec.from;
            emit(flat, state, std::move(spec));
            if (m->deactivate_source) deactivate(state, from);
        } else if (const auto* n = std::get_if<diagram_model::Note>(&st)) {
            if (n->participants.empty()) continue;
            NoteSpec spec;
            spec.placement = n->placement;
            spec.first = table.index_of(n->participants.front());
            spec.last = table.index_of(n->participants.back());
            if (spec.first > spec.last) std::swap(spec.first, spec.last);
            spec.text = n->text;
            emit(flat, state, std::move(spec));
        } else if (const auto* a = std::get_if<diagram_model::Activate>(&st)) {
            ++state.depths[static_cast<std::size_t>(table.index_of(a->id))];
        } else if (const auto* d = std::get_if<diagram_model::Deactivate>(&st)) {
            deactivate(state, table.index_of(d->id));
        } else if (const auto* x = std::get_if<diagram_model::Destroy>(&st)) {
            const int idx = table.index_of(x->id);
            emit(flat, state, DestroySpec{ idx });
            flat.destroyed[static_cast<std::size_t>(idx)] = true;
        } else if (const auto* b = std::get_if<diagram_model::Block>(&st)) {
            const int id = static_cast<int>(flat.frames.size());
            FrameInfo info;
            info.parent = state.open_frames.empty() ? -1 : state.open_frames.back();
            flat.frames.push_back(info);

            std::string label = frame_label(diagram_model::block_keyword(b->kind), b->label);
            flat.frames[static_cast<std::size_t>(id)].label_width = text_metrics::display_width(label);
            emit(flat, state, FrameSpec{ FrameEdge::Start, id, std::move(label) });
            state.open_frames.push_back(id);
            flatten(b->body, table, state, flat);
            for (const auto& br : b->branches) {
                std::string divider = frame_label(diagram_model::branch_keyword(b->kind), br.label);
                auto& width = flat.frames[static_cast<std::size_t>(id)].label_width;
                width = std::max(width, text_metrics::display_width(divider));
                emit(flat, state, FrameSpec{ FrameEdge::Divider, id, std::move(divider) });
                flatten(br.body, table, state, flat);
            }
            emit(flat, state, FrameSpec{ FrameEdge::End, id, {} });
            state.open_frames.pop_back();
        }
    }
}

FlatSequence flatten_diagram(const diagram_model::SequenceDiagram& diagram, const ParticipantTable& table) {
    FlatSequence flat;
    flat.destroyed.assign(table.size(), false);
    WalkState state;
    state.depths.assign(table.size(), 0);
    state.autonumber = contains_autonumber(diagram.statements);
    flatten(diagram.statements, table, state, flat);
    return flat;
}

int box_width(const std::string& name) {
    return text_metrics::multiline_width(name) + layout::box_padding;
}

int note_width(const std::string& text) {
    return text_metrics::multiline_width(text) + layout::box_padding;
}

// Right-most column a self message reaches, relative to its lifeline.
int self_loop_reach(const std::string& text) {
    return std::max(seq::self_loop_arm, layout::label_inset + text_metrics::multiline_width(text));
}

std::vector<int> structural_gaps(const std::vector<std::string>& names) {
    std::vector<int> gaps;
    for (std::size_t i = 0; i + 1 < names.size(); ++i) gaps.push_back(structural_gap(names[i], names[i + 1]));
    return gaps;
}

std::vector<int> compute_gaps(const FlatSequence& flat, const std::vector<std::string>& names) {
    const int n = static_cast<int>(names.size());
    std::vector<int> gaps(static_cast<std::size_t>(std::max(0, n - 1)), seq::min_gap);
    auto raise = [&](int i, int value) {
        if (i < 0 || i >= n - 1) return;
        auto& gap = gaps[static_cast<std::size_t>(i)];
        gap = std::max(gap, value);
    };

    for (const auto& row : flat.rows) {
        if (const auto* m = std::get_if<MessageSpec>(&row)) {
            if (m->from == m->to) {
                raise(m->from, self_loop_reach(m->text) + 2);
                continue;
            }
            const int left = std::min(m->from, m->to);
            const int right = std::max(m->from, m->to);
            const int span = right - left;
            const int required = text_metrics::multiline_width(m->text) + seq::arrow_decoration_width
                + seq::message_label_margin;
            const int per_gap = (required + span - 1) / span;
            for (int i = left; i < right; ++i) raise(i, per_gap);
        } else if (const auto* note = std::get_if<NoteSpec>(&row)) {
            const int w = note_width(note->text);
            switch (note->placement) {
            case diagram_model::NotePlacement::RightOf:
                raise(note->first, w + seq::note_clearance);
                break;
            case diagram_model::NotePlacement::LeftOf:
                raise(note->first - 1, w + seq::note_clearance);
                break;
            case diagram_model::NotePlacement::Over:
                if (note->first == note->last) {
                    const int half = (w + 1) / 2 + seq::note_offset;
                    raise(note->first - 1, half);
                    raise(note->first, half);
                } else {
                    const int span = note->last - note->first;
                    const int required = std::max(0, w - 2 * seq::note_offset);
                    const int per_gap = (required + span - 1) / span;
                    for (int i = note->first; i < note->last; ++i) raise(i, per_gap);
                }
                break;
            }
        }
    }

    const auto minimum = structural_gaps(names);
    for (std::size_t i = 0; i < gaps.size(); ++i) gaps[i] = std::max(gaps[i], minimum[i]);
    return gaps;
}

std::vector<PlacedParticipant> position_participants(const ParticipantTable& table,
    const std::vector<std::string>& names, const std::vector<int>& gaps)
{
    std::vector<PlacedParticipant> out;
    int center = 0;
    for (std::size_t i = 0; i < names.size(); ++i) {
        const int w = box_width(names[i]);
        center = i == 0 ? w / 2 : center + gaps[i - 1];
        PlacedParticipant p;
        p.id = table.ids()[i];
        p.name = names[i];
        p.center_col = center;
        p.box_left = center - w / 2;
        p.box_right = center + (w - 1) / 2;
        out.push_back(std::move(p));
    }
    return out;
}

NoteRow place_note(const NoteSpec& note, const std::vector<PlacedParticipant>& participants) {
    const int w = note_width(note.text);
    const int first = participants[static_cast<std::size_t>(note.first)].center_col;
    const int last = participants[static_cast<std::size_t>(note.last)].center_col;
    NoteRow row;
    row.text = note.text;
    switch (note.placement) {
    case diagram_model::NotePlacement::RightOf:
        row.box_left = first + seq::note_offset;
        row.box_right = row.box_left + w - 1;
        break;
    case diagram_model::NotePlacement::LeftOf:
        row.box_right = first - seq::note_offset;
        row.box_left = row.box_right - w + 1;
        break;
    case diagram_model::NotePlacement::Over:
        if (note.first == note.last) {
            row.box_left = first - w / 2;
            row.box_right = row.box_left + w - 1;
        } else {
            row.box_left = first - seq::note_offset;
            row.box_right = std::max(last + seq::note_offset, row.box_left + w - 1);
        }
        break;
    }
    return row;
}

PlacedSequence build_layout(const FlatSequence& flat, const ParticipantTable& table,
    const std::vector<std::string>& names, const std::vector<int>& gaps)
{
    PlacedSequence out;
    out.participants = position_participants(table, names, gaps);
    out.activations = flat.activations;
    out.destroyed = flat.destroyed;

    const std::size_t frame_count = flat.frames.size();
    std::vector<int> content_left(frame_count, INT_MAX);
    std::vector<int> content_right(frame_count, INT_MIN);
    auto widen = [&](int frame, int left, int right) {
        for (int f = frame; f >= 0; f = flat.frames[static_cast<std::size_t>(f)].parent) {
            const auto i = static_cast<std::size_t>(f);
            content_left[i] = std::min(content_left[i], left);
            content_right[i] = std::max(content_right[i], right);
        }
    };

    const int first_left = out.participants.front().box_left;
    const int last_right = out.participants.back().box_right;
    int min_left = first_left;
    int max_right = last_right;

    for (std::size_t r = 0; r < flat.rows.size(); ++r) {
        const RowSpec& spec = flat.rows[r];
        if (const auto* m = std::get_if<MessageSpec>(&spec)) {
            MessageRow row;
            row.from_index = m->from;
            row.to_index = m->to;
            row.from_col = out.participants[static_cast<std::size_t>(m->from)].center_col;
            row.to_col = out.participants[static_cast<std::size_t>(m->to)].center_col;
            row.text = m->text;
            row.arrow = m->arrow;
            row.direction = m->from <= m->to ? MessageDirection::LeftToRight : MessageDirection::RightToLeft;
            if (row.is_self()) {
                const int reach = row.from_col + self_loop_reach(m->text);
                widen(flat.row_frames[r], row.from_col, reach);
                max_right = std::max(max_right, reach);
            }
            out.rows.emplace_back(std::move(row));
        } else if (const auto* note = std::get_if<NoteSpec>(&spec)) {
            NoteRow row = place_note(*note, out.participants);
            widen(flat.row_frames[r], row.box_left, row.box_right);
            min_left = std::min(min_left, row.box_left);
            max_right = std::max(max_right, row.box_right);
            out.rows.emplace_back(std::move(row));
        } else if (const auto* frame = std::get_if<FrameSpec>(&spec)) {
            FrameRow row;
            row.edge = frame->edge;
            row.frame_id = frame->frame_id;
            row.label = frame->label;
            out.rows.emplace_back(std::move(row));
        } else if (const auto* destroy = std::get_if<DestroySpec>(&spec)) {
            const auto idx = static_cast<std::size_t>(destroy->participant);
            out.rows.emplace_back(DestroyRow{ destroy->participant, out.participants[idx].center_col });
        }
    }

    // Frame ids grow with nesting depth, so walking them backwards settles
    // every inner frame before the frame around it.
    std::vector<int> frame_left(frame_count, 0);
    std::vector<int> frame_right(frame_count, 0);
    std::vector<int> child_left(frame_count, INT_MAX);
    std::vector<int> child_right(frame_count, INT_MIN);
    for (std::size_t i = frame_count; i-- > 0;) {
        const int inner_left = std::min({ first_left, content_left[i], child_left[i] });
        const int inner_right = std::max({ last_right, content_right[i], child_right[i] });
        frame_left[i] = inner_left - 1;
        frame_right[i] = std::max(inner_right + 1, frame_left[i] + flat.frames[i].label_width + 3);
        const int parent = flat.frames[i].parent;
        if (parent >= 0) {
            const auto p = static_cast<std::size_t>(parent);
            child_left[p] = std::min(child_left[p], frame_left[i]);
            child_right[p] = std::max(child_right[p], frame_right[i]);
        }
        min_left = std::min(min_left, frame_left[i]);
        max_right = std::max(max_right, frame_right[i]);
    }

    const int shift = -std::min(0, min_left);
    for (auto& p : out.participants) {
        p.center_col += shift;
        p.box_left += shift;
        p.box_right += shift;
    }
    int content_width = max_right + shift + 1;
    for (auto& row : out.rows) {
        if (auto* m = std::get_if<MessageRow>(&row)) {
            m->from_col += shift;
            m->to_col += shift;
            const int text_left = m->is_self() ? m->from_col + layout::label_inset
                                               : std::min(m->from_col, m->to_col) + layout::label_inset;
            content_width = std::max(content_width, text_left + text_metrics::multiline_width(m->text));
        } else if (auto* note = std::get_if<NoteRow>(&row)) {
            note->box_left += shift;
            note->box_right += shift;
        } else if (auto* frame = std::get_if<FrameRow>(&row)) {
            const auto i = static_cast<std::size_t>(frame->frame_id);
            frame->frame_left = frame_left[i] + shift;
            frame->frame_right = frame_right[i] + shift;
        } else if (auto* destroy = std::get_if<DestroyRow>(&row)) {
            destroy->col += shift;
        }
    }

    for (const auto& p : out.participants)
        out.box_height = std::max(out.box_height, 2 + text_metrics::line_count(p.name));
    out.total_width = max_right + shift + 1;
    out.content_width = content_width;
    out.total_height = 2 * out.box_height;
    for (const auto& row : out.rows) out.total_height += row_height(row);
    return out;
}

// Takes `excess` columns off the gaps, each in proportion to its slack above
// the minimum. Never goes below the minimum.
std::vector<int> shrink_gaps(const std::vector<int>& gaps, const std::vector<int>& minimum, int excess) {
    int slack_total = 0;
    for (std::size_t i = 0; i < gaps.size(); ++i) slack_total += gaps[i] - minimum[i];
    if (slack_total <= 0) return gaps;
    if (excess >= slack_total) return minimum;

    std::vector<int> cuts(gaps.size(), 0);
    int remaining = excess;
    for (std::size_t i = 0; i < gaps.size(); ++i) {
        cuts[i] = (gaps[i] - minimum[i]) * excess / slack_total;
        remaining -= cuts[i];
    }
    while (remaining > 0) {
        for (std::size_t i = 0; i < gaps.size() && remaining > 0; ++i) {
            if (cuts[i] < gaps[i] - minimum[i]) {
                ++cuts[i];
                --remaining;
            }
        }
    }
    std::vector<int> out(gaps.size());
    for (std::size_t i = 0; i < gaps.size(); ++i) out[i] = gaps[i] - cuts[i];
    return out;
}

std::size_t longest_name(const std::vector<std::string>& names) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < names.size(); ++i)
        if (text_metrics::multiline_width(names[i]) > text_metrics::multiline_width(names[best])) best = i;
    return best;
}

} // namespace

int row_height(const SequenceRow& row) {
    if (const auto* m = std::get_if<MessageRow>(&row)) return 2 + text_metrics::line_count(m->text);
    if (const auto* n = std::get_if<NoteRow>(&row)) return 2 + text_metrics::line_count(n->text);
    return 1;
}

int structural_gap(const std::string& left_name, const std::string& right_name) {
    return text_metrics::multiline_width(left_name) / 2 + seq::box_half_padding
        + text_metrics::multiline_width(right_name) / 2 + seq::box_half_padding + seq::box_separation;
}

std::optional<PlacedSequence> place_sequence(const diagram_model::SequenceDiagram& diagram,
    std::optional<int> max_width, LayoutError* error)
{
    ParticipantTable table;
    collect_participants(diagram.statements, table);
    if (table.size() == 0) {
        if (error) *error = { LayoutErrorKind::EmptyDiagram, "no participants found", 0 };
        return std::nullopt;
    }
    const FlatSequence flat = flatten_diagram(diagram, table);
    std::vector<std::string> names = table.names();

    PlacedSequence placed = build_layout(flat, table, names, compute_gaps(flat, names));
    spdlog::debug("sequence layout: {} participants, {} rows, width {}",
        placed.participants.size(), placed.rows.size(), placed.total_width);
    if (!max_width || placed.total_width <= *max_width) return placed;

    // Every pass either returns or takes one column off a name, so the loop
    // ends once all names are at the floor.
    for (;;) {
        const std::vector<int> gaps = compute_gaps(flat, names);
        placed = build_layout(flat, table, names, gaps);
        if (placed.total_width <= *max_width) return placed;

        const std::vector<int> minimum = structural_gaps(names);
        const std::vector<int> shrunk = shrink_gaps(gaps, minimum, placed.total_width - *max_width);
        placed = build_layout(flat, table, names, shrunk);
        spdlog::debug("sequence layout: shrunk gaps give width {}", placed.total_width);
        if (placed.total_width <= *max_width) return placed;
        if (shrunk != minimum) {
            placed = build_layout(flat, table, names, minimum);
            if (placed.total_width <= *max_width) return placed;
        }

        const std::size_t idx = longest_name(names);
        const int width = text_metrics::multiline_width(names[idx]);
        if (width <= seq::min_name_width) break;
        names[idx] = text_metrics::truncate_to_width(names[idx], width - 1);
        spdlog::debug("sequence layout: truncating participant {} to {}", table.ids()[idx], names[idx]);
    }

    if (error) {
        *error = { LayoutErrorKind::InfeasibleWidth,
            "diagram too wide: needs at least " + std::to_string(placed.total_width)
                + " columns but max width is " + std::to_string(*max_width),
            placed.total_width };
    }
    return std::nullopt;
}

} // namespace diagram_placement
