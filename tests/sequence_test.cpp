#include <diagram_placement/sequence_placement.hpp>
#include <diagram_render/renderer.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace diagram_model;
using diagram_placement::LayoutError;
using diagram_placement::LayoutErrorKind;
using diagram_placement::place_sequence;

namespace {

Message message(const std::string& from, const std::string& to, const std::string& text,
    LineStyle line = LineStyle::Solid, ArrowHead head = ArrowHead::Arrowhead)
{
    Message m;
    m.from = from;
    m.to = to;
    m.text = text;
    m.arrow = { line, head };
    return m;
}

std::string render(const SequenceDiagram& d) {
    auto placed = place_sequence(d);
    EXPECT_TRUE(placed.has_value());
    return placed ? diagram_render::render_sequence_diagram(*placed) : std::string{};
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

} // namespace

TEST(SequenceLayout, TwoParticipantsSnapshot) {
    SequenceDiagram d;
    d.statements.emplace_back(message("Alice", "Bob", "Hello"));
    d.statements.emplace_back(message("Bob", "Alice", "Hi!", LineStyle::Dotted));

    const std::string expected =
        "┌───────┐  ┌─────┐\n"
        "│ Alice │  │ Bob │\n"
        "└───┬───┘  └──┬──┘\n"
        "    │ Hello   │\n"
        "    │────────>│\n"
        "    │         │\n"
        "    │ Hi!     │\n"
        "    │< ─ ─ ─ ─│\n"
        "    │         │\n"
        "┌───┴───┐  ┌──┴──┐\n"
        "│ Alice │  │ Bob │\n"
        "└───────┘  └─────┘";
    EXPECT_EQ(render(d), expected);
}

TEST(SequenceLayout, ParticipantsKeepFirstSeenOrder) {
    SequenceDiagram d;
    d.statements.emplace_back(ParticipantDecl{ "B", "Bob", false });
    d.statements.emplace_back(message("A", "B", "x"));
    auto placed = place_sequence(d);
    ASSERT_TRUE(placed);
    ASSERT_EQ(placed->participants.size(), 2u);
    EXPECT_EQ(placed->participants[0].name, "Bob");
    EXPECT_EQ(placed->participants[1].id, "A");
    EXPECT_LT(placed->participants[0].center_col, placed->participants[1].center_col);
}

TEST(SequenceLayout, GapsGrowWithMessageText) {
    SequenceDiagram d;
    d.statements.emplace_back(message("A", "B", "a fairly long message label"));
    auto placed = place_sequence(d);
    ASSERT_TRUE(placed);
    const int gap = placed->participants[1].center_col - placed->participants[0].center_col;
    EXPECT_GE(gap, 27 + 4);
}

TEST(SequenceLayout, ActivationDrawsHeavyLifeline) {
    SequenceDiagram d;
    Message call = message("Alice", "Bob", "Hi");
    call.activate_target = true;
    Message reply = message("Bob", "Alice", "Ok", LineStyle::Dotted);
    reply.deactivate_source = true;
    d.statements.emplace_back(call);
    d.statements.emplace_back(reply);

    auto placed = place_sequence(d);
    ASSERT_TRUE(placed);
    EXPECT_TRUE(placed->activations[0][1]);
    EXPECT_TRUE(placed->activations[1][1]);
    EXPECT_FALSE(placed->activations[0][0]);

    const auto lines = lines_of(diagram_render::render_sequence_diagram(*placed));
    for (int row = 3; row < 9; ++row) {
        EXPECT_EQ(lines[static_cast<std::size_t>(row)].substr(4, 3), "│");
        EXPECT_NE(lines[static_cast<std::size_t>(row)].find("┃"), std::string::npos) << row;
    }
}

TEST(SequenceLayout, ExplicitActivateAndDeactivate) {
    SequenceDiagram d;
    d.statements.emplace_back(Activate{ "A" });
    d.statements.emplace_back(message("A", "B", "one"));
    d.statements.emplace_back(Deactivate{ "A" });
    d.statements.emplace_back(message("A", "B", "two"));
    auto placed = place_sequence(d);
    ASSERT_TRUE(placed);
    EXPECT_TRUE(placed->activations[0][0]);
    EXPECT_FALSE(placed->activations[1][0]);
}

TEST(SequenceLayout, NoteRightOfParticipant) {
    SequenceDiagram d;
    d.statements.emplace_back(message("Alice", "Bob", "Hello"));
    d.statements.emplace_back(Note{ NotePlacement::RightOf, { "Bob" }, "Hi" });

    const auto lines = lines_of(render(d));
    ASSERT_GE(lines.size(), 9u);
    EXPECT_EQ(lines[6], "    │         │ ┌────┐");
    EXPECT_EQ(lines[7], "    │         │ │ Hi │");
    EXPECT_EQ(lines[8], "    │         │ └────┘");
}

TEST(SequenceLayout, NoteLeftOfFirstParticipantShiftsDiagram) {
    SequenceDiagram d;
    d.statements.emplace_back(Note{ NotePlacement::LeftOf, { "A" }, "note" });
    auto placed = place_sequence(d);
    ASSERT_TRUE(placed);
    const auto& note = std::get<diagram_placement::NoteRow>(placed->rows[0]);
    EXPECT_EQ(note.box_left, 0);
    EXPECT_EQ(note.box_right, placed->participants[0].center_col - 2);
}

TEST(SequenceLayout, NoteOverTwoParticipantsSpansBoth) {
    SequenceDiagram d;
    d.statements.emplace_back(message("A", "B", "x"));
    d.statements.emplace_back(Note{ NotePlacement::Over, { "B", "A" }, "shared" });
    auto placed = place_sequence(d);
    ASSERT_TRUE(placed);
    const auto& note = std::get<diagram_placement::NoteRow>(placed->rows[1]);
    EXPECT_LT(note.box_left, placed->participants[0].center_col);
    EXPECT_GT(note.box_right, placed->participants[1].center_col);
}

TEST(SequenceLayout, LoopFrameSnapshot) {
    SequenceDiagram d;
    Block loop;
    loop.kind = BlockKind::Loop;
    loop.label = "Every minute";
    loop.body.emplace_back(message("Alice", "Bob", "Ping"));
    d.statements.emplace_back(std::move(loop));

    const std::string expected =
        " ┌───────┐  ┌─────┐\n"
        " │ Alice │  │ Bob │\n"
        " └───┬───┘  └──┬──┘\n"
        "┌─loop Every minute─┐\n"
        "│    │ Ping    │    │\n"
        "│    │────────>│    │\n"
        "│    │         │    │\n"
        "└────┼─────────┼────┘\n"
        " ┌───┴───┐  ┌──┴──┐\n"
        " │ Alice │  │ Bob │\n"
        " └───────┘  └─────┘";
    EXPECT_EQ(render(d), expected);
}

TEST(SequenceLayout, AltFrameWithElseDivider) {
    SequenceDiagram d;
    Block alt;
    alt.kind = BlockKind::Alt;
    alt.label = "ok";
    alt.body.emplace_back(message("A", "B", "yes"));
    Branch otherwise;
    otherwise.label = "fail";
    otherwise.body.emplace_back(message("A", "B", "no"));
    alt.branches.push_back(std::move(otherwise));
    d.statements.emplace_back(std::move(alt));

    const auto lines = lines_of(render(d));
    ASSERT_EQ(lines.size(), 3u + 1 + 3 + 1 + 3 + 1 + 3);
    EXPECT_EQ(lines[3], "┌─alt ok─────┼──┐");
    EXPECT_EQ(lines[7], "├─else fail──┼──┤");
    EXPECT_EQ(lines[11], "└──┼─────────┼──┘");
}

TEST(SequenceLayout, NestedFramesAreContained) {
    SequenceDiagram d;
    Block inner;
    inner.kind = BlockKind::Opt;
    inner.label = "maybe";
    inner.body.emplace_back(message("A", "B", "x"));
    Block outer;
    outer.kind = BlockKind::Loop;
    outer.body.emplace_back(std::move(inner));
    d.statements.emplace_back(std::move(outer));

    auto placed = place_sequence(d);
    ASSERT_TRUE(placed);
    const auto& outer_row = std::get<diagram_placement::FrameRow>(placed->rows[0]);
    const auto& inner_row = std::get<diagram_placement::FrameRow>(placed->rows[1]);
    EXPECT_LT(outer_row.frame_left, inner_row.frame_left);
    EXPECT_GT(outer_row.frame_right, inner_row.frame_right);
    EXPECT_GE(outer_row.frame_left, 0);
}

TEST(SequenceLayout, AutonumberPrefixesMessages) {
    SequenceDiagram d;
    d.statements.emplace_back(AutoNumber{});
    d.statements.emplace_back(message("A", "B", "hi"));
    d.statements.emplace_back(message("B", "A", "yo"));
    const std::string out = render(d);
    EXPECT_NE(out.find("1. hi"), std::string::npos);
    EXPECT_NE(out.find("2. yo"), std::string::npos);
}

TEST(SequenceLayout, SelfMessageSnapshot) {
    SequenceDiagram d;
    d.statements.emplace_back(message("A", "A", "self"));
    const auto lines = lines_of(render(d));
    ASSERT_EQ(lines.size(), 9u);
    EXPECT_EQ(lines[3], "  │ self");
    EXPECT_EQ(lines[4], "  │───┐");
    EXPECT_EQ(lines[5], "  │<──┘");
}

TEST(SequenceLayout, DottedSelfMessageReturnsOnASolidArm) {
    SequenceDiagram d;
    d.statements.emplace_back(message("A", "A", "self", LineStyle::Dotted));
    const auto lines = lines_of(render(d));
    ASSERT_EQ(lines.size(), 9u);
    EXPECT_EQ(lines[4], "  │─ ─┐");
    EXPECT_EQ(lines[5], "  │<──┘");
}

TEST(SequenceLayout, ArrowHeadVariants) {
    SequenceDiagram d;
    d.statements.emplace_back(message("A", "B", "c", LineStyle::Solid, ArrowHead::Cross));
    d.statements.emplace_back(message("A", "B", "o", LineStyle::Solid, ArrowHead::Open));
    d.statements.emplace_back(message("A", "B", "n", LineStyle::Solid, ArrowHead::None));
    const auto lines = lines_of(render(d));
    EXPECT_EQ(lines[4], "  │────────x│");
    EXPECT_EQ(lines[7], "  │────────)│");
    EXPECT_EQ(lines[10], "  │─────────│");
}

TEST(SequenceLayout, DestroyedParticipantHasNoBottomBox) {
    SequenceDiagram d;
    d.statements.emplace_back(message("A", "B", "bye"));
    d.statements.emplace_back(Destroy{ "B" });
    const auto lines = lines_of(render(d));
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(lines[6], "  │         ●");
    EXPECT_EQ(lines[7], "┌─┴─┐");
    EXPECT_EQ(lines[9], "└───┘");
}

TEST(SequenceLayout, MultilineParticipantNamesShareBoxHeight) {
    SequenceDiagram d;
    d.statements.emplace_back(ParticipantDecl{ "A", "Two<br>lines", false });
    d.statements.emplace_back(message("A", "B", "x"));
    auto placed = place_sequence(d);
    ASSERT_TRUE(placed);
    EXPECT_EQ(placed->box_height, 4);
}

TEST(SequenceLayout, EmptyDiagramIsAnError) {
    LayoutError err;
    EXPECT_FALSE(place_sequence(SequenceDiagram{}, std::nullopt, &err));
    EXPECT_EQ(err.kind, LayoutErrorKind::EmptyDiagram);
    EXPECT_EQ(err.message, "no participants found");
}

TEST(SequenceLayout, ShrinkGapsToFitWidth) {
    SequenceDiagram d;
    d.statements.emplace_back(message("Alice", "Bob", "this is a long message text"));
    auto wide = place_sequence(d);
    ASSERT_TRUE(wide);
    ASSERT_GT(wide->total_width, 30);

    auto placed = place_sequence(d, 30);
    ASSERT_TRUE(placed);
    EXPECT_LE(placed->total_width, 30);
    EXPECT_EQ(placed->participants[0].name, "Alice");
    EXPECT_EQ(placed->participants[1].name, "Bob");
}

TEST(SequenceLayout, TruncatesLongestNameWhenGapsAreMinimal) {
    SequenceDiagram d;
    d.statements.emplace_back(message("Alexander", "Bob", "x"));
    auto placed = place_sequence(d, 19);
    ASSERT_TRUE(placed);
    EXPECT_EQ(placed->total_width, 19);
    EXPECT_EQ(placed->participants[0].name, "Alexan…");
    EXPECT_EQ(placed->participants[1].name, "Bob");
}

TEST(SequenceLayout, InfeasibleWidthReportsMinimum) {
    SequenceDiagram d;
    d.statements.emplace_back(message("Alice", "Bob", "hi"));
    LayoutError err;
    EXPECT_FALSE(place_sequence(d, 5, &err));
    EXPECT_EQ(err.kind, LayoutErrorKind::InfeasibleWidth);
    EXPECT_EQ(err.min_width, 14);
    EXPECT_EQ(err.message, "diagram too wide: needs at least 14 columns but max width is 5");
}

TEST(SequenceLayout, WidthWithinBudgetIsUntouched) {
    SequenceDiagram d;
    d.statements.emplace_back(message("Alice", "Bob", "Hello"));
    auto unbounded = place_sequence(d);
    auto bounded = place_sequence(d, 100);
    ASSERT_TRUE(unbounded && bounded);
    EXPECT_EQ(unbounded->total_width, bounded->total_width);
}
