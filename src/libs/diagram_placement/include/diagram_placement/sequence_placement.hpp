#pragma once

#include <diagram_model/sequence_diagram.hpp>
#include <diagram_placement/layout_error.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace diagram_placement {

struct PlacedParticipant {
    std::string id;
    std::string name; // shortened with an ellipsis when squeezed into a width limit
    int center_col = 0;
    int box_left = 0;
    int box_right = 0;
};

enum class MessageDirection { LeftToRight, RightToLeft };

struct MessageRow {
    int from_index = 0;
    int to_index = 0;
    int from_col = 0;
    int to_col = 0;
    std::string text;
    diagram_model::Arrow arrow;
    MessageDirection direction = MessageDirection::LeftToRight;

    bool is_self() const { return from_index == to_index; }
};

struct NoteRow {
    int box_left = 0;
    int box_right = 0;
    std::string text;
};

enum class FrameEdge { Start, Divider, End };

struct FrameRow {
    FrameEdge edge = FrameEdge::Start;
    int frame_id = 0;
    int frame_left = 0;
    int frame_right = 0;
    std::string label;
};

struct DestroyRow {
    int participant_index = 0;
    int col = 0;
};

using SequenceRow = std::variant<MessageRow, NoteRow, FrameRow, DestroyRow>;

int row_height(const SequenceRow& row);

struct PlacedSequence {
    std::vector<PlacedParticipant> participants;
    std::vector<SequenceRow> rows;
    std::vector<std::vector<bool>> activations; // [row][participant]
    std::vector<bool> destroyed;
    int box_height = 0;
    int total_width = 0;
    int total_height = 0;
    // total_width widened by message text that runs past the last element
    int content_width = 0;
};

// Minimum distance between the centres of two neighbouring participants.
int structural_gap(const std::string& left_name, const std::string& right_name);

// With max_width set, gaps are shrunk toward their structural minimum and
// then the longest participant names are truncated one column at a time.
std::optional<PlacedSequence> place_sequence(const diagram_model::SequenceDiagram& diagram,
    std::optional<int> max_width = std::nullopt, LayoutError* error = nullptr);

} // namespace diagram_placement
