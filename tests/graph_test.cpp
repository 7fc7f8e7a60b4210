#include <diagram_placement/placer.hpp>
#include <diagram_render/renderer.hpp>
#include <gtest/gtest.h>

using namespace diagram_model;
using diagram_placement::LayoutError;
using diagram_placement::LayoutErrorKind;
using diagram_placement::place_diagram;

namespace {

Node node(const std::string& id, Node::Shape shape = Node::Shape::Box) {
    return Node{ id, id, shape };
}

Edge edge(const std::string& from, const std::string& to, const std::string& label = "",
    EdgeStyle style = EdgeStyle::Arrow)
{
    return Edge{ from, to, style, label };
}

std::string render(const GraphDiagram& d) {
    auto placed = place_diagram(d);
    EXPECT_TRUE(placed.has_value());
    return placed ? diagram_render::render_diagram(*placed) : std::string{};
}

} // namespace

TEST(GraphLayout, TopDownChainSnapshot) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B") };
    d.edges = { edge("A", "B") };
    const std::string expected =
        "┌───┐\n"
        "│ A │\n"
        "└─┬─┘\n"
        "  │\n"
        "  ▼\n"
        "┌───┐\n"
        "│ B │\n"
        "└───┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, FanOutSnapshot) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "B"), edge("A", "C") };
    const std::string expected =
        "    ┌───┐\n"
        "    │ A │\n"
        "    └─┬─┘\n"
        "  ┌───┴───┐\n"
        "  ▼       ▼\n"
        "┌───┐   ┌───┐\n"
        "│ B │   │ C │\n"
        "└───┘   └───┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, FanInSnapshot) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "C"), edge("B", "C") };
    const std::string expected =
        "┌───┐   ┌───┐\n"
        "│ A │   │ B │\n"
        "└─┬─┘   └─┬─┘\n"
        "  └───┬───┘\n"
        "      ▼\n"
        "    ┌───┐\n"
        "    │ C │\n"
        "    └───┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, LeftRightSnapshot) {
    GraphDiagram d;
    d.direction = Direction::LeftRight;
    d.nodes = { node("Start"), node("End") };
    d.edges = { edge("Start", "End") };
    const std::string expected =
        "┌───────┐     ┌─────┐\n"
        "│ Start │────>│ End │\n"
        "└───────┘     └─────┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, LeftRightLabelSitsAboveTheLine) {
    GraphDiagram d;
    d.direction = Direction::LeftRight;
    d.nodes = { node("A"), node("B") };
    d.edges = { edge("A", "B", "yes") };
    const std::string expected =
        "┌───┐ yes ┌───┐\n"
        "│ A │────>│ B │\n"
        "└───┘     └───┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, LeftRightLabelWidensRankGap) {
    GraphDiagram d;
    d.direction = Direction::LeftRight;
    d.nodes = { node("A"), node("B") };
    d.edges = { edge("A", "B", "a long label") };
    auto placed = place_diagram(d);
    ASSERT_TRUE(placed);
    const auto* a = placed->find_node("A");
    const auto* b = placed->find_node("B");
    ASSERT_TRUE(a && b);
    EXPECT_GE(b->rect.x - a->rect.right() - 1, 12 + 2);
}

TEST(GraphLayout, LeftRightFanOutLabelsSnapshot) {
    GraphDiagram d;
    d.direction = Direction::LeftRight;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "B", "yes"), edge("A", "C", "no") };
    const std::string expected =
        "┌───┐ yes ┌───┐\n"
        "│ A │──┬─>│ B │\n"
        "└───┘  │  └───┘\n"
        "       │\n"
        "       │\n"
        "       │no┌───┐\n"
        "       └─>│ C │\n"
        "          └───┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, TopDownEdgeSkippingARankGoesAround) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "B"), edge("B", "C"), edge("A", "C") };
    const std::string expected =
        "┌───┐\n"
        "│ A │\n"
        "└─┬─┘\n"
        "  ├───┐\n"
        "  ▼   │\n"
        "┌───┐ │\n"
        "│ B │ │\n"
        "└─┬─┘ │\n"
        "  ├───┘\n"
        "  ▼\n"
        "┌───┐\n"
        "│ C │\n"
        "└───┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, SkippingEdgeGetsADetourAndRoomForIt) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "B"), edge("B", "C"), edge("A", "C") };
    auto placed = place_diagram(d);
    ASSERT_TRUE(placed);
    EXPECT_TRUE(placed->placed_edges[0].detour.empty());
    EXPECT_TRUE(placed->placed_edges[1].detour.empty());
    const auto& detour = placed->placed_edges[2].detour;
    ASSERT_FALSE(detour.empty());
    EXPECT_EQ(detour.front(), (diagram_placement::GridPoint{ 2, 3 }));
    EXPECT_EQ(detour.back(), (diagram_placement::GridPoint{ 2, 9 }));
    EXPECT_EQ(placed->width, 7);
    for (const auto& p : detour)
        for (const auto& n : placed->placed_nodes) EXPECT_FALSE(n.rect.contains(p.col, p.row));
}

TEST(GraphLayout, LeftRightEdgeSkippingARankRunsBelow) {
    GraphDiagram d;
    d.direction = Direction::LeftRight;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "B"), edge("B", "C"), edge("A", "C", "skip") };
    const std::string expected =
        "┌───┐     ┌───┐     ┌───┐\n"
        "│ A │─┬──>│ B │───┬>│ C │\n"
        "└───┘ │   └───┘   │ └───┘\n"
        "      │   skip    │\n"
        "      └───────────┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, EdgeIntoSubgraphKeepsItsTitle) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "B"), edge("B", "C") };
    d.subgraphs = { Subgraph{ "one", "one", { "A", "B" } }, Subgraph{ "two", "two", { "C" } } };
    const std::string expected =
        "┌─ one ─┐\n"
        "│       │\n"
        "│ ┌───┐ │\n"
        "│ │ A │ │\n"
        "│ └─┬─┘ │\n"
        "│   │   │\n"
        "│   ▼   │\n"
        "│ ┌───┐ │\n"
        "│ │ B │ │\n"
        "│ └─┬─┘ │\n"
        "└───┼───┘\n"
        "    │\n"
        "    │\n"
        "┌─ two ─┐\n"
        "│   ▼   │\n"
        "│ ┌───┐ │\n"
        "│ │ C │ │\n"
        "│ └───┘ │\n"
        "└───────┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, LeftRightLabelStaysOffSubgraphBorder) {
    GraphDiagram d;
    d.direction = Direction::LeftRight;
    d.nodes = { node("A"), node("B") };
    d.edges = { edge("A", "B", "go") };
    d.subgraphs = { Subgraph{ "g", "g", { "A" } } };
    const std::string expected =
        "┌─ g ───┐  go ┌───┐\n"
        "│       │ ┌──>│ B │\n"
        "│ ┌───┐ │ │   └───┘\n"
        "│ │ A │─┼─┘\n"
        "│ └───┘ │\n"
        "└───────┘";
    EXPECT_EQ(render(d), expected);
}

TEST(GraphLayout, EdgeStylesUseTheirGlyphs) {
    GraphDiagram d;
    d.direction = Direction::LeftRight;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "B", "", EdgeStyle::DottedLink), edge("B", "C", "", EdgeStyle::ThickArrow) };
    const std::string out = render(d);
    EXPECT_NE(out.find("│ A │╌╌╌╌╌│ B │════>│ C │"), std::string::npos) << out;
}

TEST(GraphLayout, ShapesHaveDistinctBorders) {
    GraphDiagram d;
    d.direction = Direction::LeftRight;
    d.nodes = { node("R", Node::Shape::Round), node("D", Node::Shape::Diamond), node("C", Node::Shape::Circle) };
    const std::string expected =
        "╭───╮   ╱───╲   ╭───────╮\n"
        "│ R │   │ D │   │   C   │\n"
        "╰───╯   ╲───╱   ╰───────╯";
    auto placed = place_diagram(d);
    ASSERT_TRUE(placed);
    // Unconnected nodes all share rank 0 and stack vertically in LR.
    EXPECT_EQ(placed->find_node("D")->rect.x, 0);

    GraphDiagram td;
    td.nodes = d.nodes;
    EXPECT_EQ(render(td), expected);
}

TEST(GraphLayout, RanksFollowEdges) {
    GraphDiagram d;
    d.nodes = { node("C"), node("B"), node("A") };
    d.edges = { edge("A", "B"), edge("B", "C") };
    auto placed = place_diagram(d);
    ASSERT_TRUE(placed);
    EXPECT_EQ(placed->find_node("A")->rank, 0);
    EXPECT_EQ(placed->find_node("C")->rank, 2);
    EXPECT_LT(placed->find_node("A")->rect.bottom(), placed->find_node("B")->rect.y);
    EXPECT_LT(placed->find_node("B")->rect.bottom(), placed->find_node("C")->rect.y);
}

TEST(GraphLayout, NodesNeverOverlap) {
    GraphDiagram d;
    d.nodes = { node("a"), node("bb"), node("ccc"), node("dddd"), node("e") };
    d.edges = { edge("a", "bb"), edge("a", "ccc"), edge("a", "dddd"), edge("bb", "e"), edge("dddd", "e") };
    auto placed = place_diagram(d);
    ASSERT_TRUE(placed);
    for (std::size_t i = 0; i < placed->placed_nodes.size(); ++i)
        for (std::size_t j = i + 1; j < placed->placed_nodes.size(); ++j)
            EXPECT_FALSE(placed->placed_nodes[i].rect.overlaps(placed->placed_nodes[j].rect));
}

TEST(GraphLayout, UndeclaredEdgeEndpointsAreAdded) {
    GraphDiagram d;
    d.nodes = { node("A") };
    d.edges = { edge("A", "Z") };
    auto placed = place_diagram(d);
    ASSERT_TRUE(placed);
    ASSERT_NE(placed->find_node("Z"), nullptr);
    EXPECT_EQ(placed->find_node("Z")->label, "Z");
}

TEST(GraphLayout, BackAndSelfEdgesAreSkipped) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B") };
    d.edges = { edge("A", "B"), edge("B", "A"), edge("B", "B") };
    const std::string out = render(d);
    std::size_t arrows = 0;
    for (std::size_t pos = out.find("▼"); pos != std::string::npos; pos = out.find("▼", pos + 1)) ++arrows;
    EXPECT_EQ(arrows, 1u);
}

TEST(GraphLayout, SubgraphContainsItsNodes) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B"), node("C") };
    d.edges = { edge("A", "B"), edge("B", "C") };
    d.subgraphs = { Subgraph{ "group", "Group", { "A", "B" } } };
    auto placed = place_diagram(d);
    ASSERT_TRUE(placed);
    ASSERT_EQ(placed->placed_subgraphs.size(), 1u);
    const auto& sg = placed->placed_subgraphs[0];
    EXPECT_EQ(sg.rect.width, 11);
    EXPECT_TRUE(sg.rect.contains(placed->find_node("A")->rect));
    EXPECT_TRUE(sg.rect.contains(placed->find_node("B")->rect));
    EXPECT_FALSE(sg.rect.overlaps(placed->find_node("C")->rect));

    const std::string out = diagram_render::render_diagram(*placed);
    EXPECT_EQ(out.substr(0, out.find('\n')), "┌─ Group ─┐");
}

TEST(GraphLayout, NodeBelongsToFirstListingSubgraph) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B") };
    d.subgraphs = { Subgraph{ "one", "One", { "A" } }, Subgraph{ "two", "Two", { "A", "B" } } };
    auto placed = place_diagram(d);
    ASSERT_TRUE(placed);
    ASSERT_EQ(placed->placed_subgraphs.size(), 2u);
    EXPECT_EQ(placed->placed_subgraphs[0].node_ids, std::vector<std::string>{ "A" });
    EXPECT_EQ(placed->placed_subgraphs[1].node_ids, std::vector<std::string>{ "B" });
}

TEST(GraphLayout, GapReductionFitsWidth) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B"), node("C"), node("D") };
    d.edges = { edge("A", "B"), edge("A", "C"), edge("A", "D") };
    auto wide = place_diagram(d);
    ASSERT_TRUE(wide);
    EXPECT_EQ(wide->width, 21);

    auto placed = place_diagram(d, 19);
    ASSERT_TRUE(placed);
    EXPECT_EQ(placed->width, 19);
}

TEST(GraphLayout, InfeasibleWidth) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B"), node("C"), node("D") };
    d.edges = { edge("A", "B"), edge("A", "C"), edge("A", "D") };
    LayoutError err;
    EXPECT_FALSE(place_diagram(d, 10, &err));
    EXPECT_EQ(err.kind, LayoutErrorKind::InfeasibleWidth);
    EXPECT_EQ(err.min_width, 17);
    EXPECT_EQ(err.message, "diagram too wide: needs at least 17 columns but max width is 10");
}

TEST(GraphLayout, SubgraphTooWideIsUnsupported) {
    GraphDiagram d;
    d.nodes = { node("A"), node("B") };
    d.subgraphs = { Subgraph{ "g", "A rather long subgraph title", { "A", "B" } } };
    LayoutError err;
    EXPECT_FALSE(place_diagram(d, 20, &err));
    EXPECT_EQ(err.kind, LayoutErrorKind::UnsupportedShape);
    EXPECT_EQ(err.message,
        "diagram with subgraphs is 34 columns wide, exceeding max width 20 (gap reduction is not attempted for subgraphs)");
}

TEST(GraphLayout, EmptyGraphIsAnError) {
    LayoutError err;
    EXPECT_FALSE(place_diagram(GraphDiagram{}, std::nullopt, &err));
    EXPECT_EQ(err.kind, LayoutErrorKind::EmptyDiagram);
    EXPECT_EQ(err.message, "no nodes found");
}
