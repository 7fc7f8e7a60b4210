#include <diagram_placement/er_placement.hpp>
#include <diagram_render/renderer.hpp>
#include <gtest/gtest.h>

using namespace diagram_model;
using diagram_placement::LayoutError;
using diagram_placement::LayoutErrorKind;
using diagram_placement::place_er_diagram;

namespace {

Relationship relation(const std::string& from, const std::string& to, Cardinality left, Cardinality right,
    const std::string& label = "", bool identifying = true)
{
    Relationship r;
    r.from = from;
    r.to = to;
    r.left_cardinality = left;
    r.right_cardinality = right;
    r.label = label;
    r.identifying = identifying;
    return r;
}

std::string render(const ErDiagram& d) {
    auto placed = place_er_diagram(d);
    EXPECT_TRUE(placed.has_value());
    return placed ? diagram_render::render_er_diagram(*placed) : std::string{};
}

ErDiagram customer_orders() {
    ErDiagram d;
    d.entities = { Entity{ "CUSTOMER", {} }, Entity{ "ORDER", {} } };
    d.relationships = { relation("CUSTOMER", "ORDER", Cardinality::ExactlyOne, Cardinality::ZeroOrMany, "places") };
    return d;
}

} // namespace

TEST(ErLayout, RelationshipSnapshot) {
    const std::string expected =
        "┌──────────┐              ┌───────┐\n"
        "│ CUSTOMER │||──places──o{│ ORDER │\n"
        "└──────────┘              └───────┘";
    EXPECT_EQ(render(customer_orders()), expected);
}

TEST(ErLayout, AttributesGetTheirOwnSection) {
    ErDiagram d;
    d.entities = { Entity{ "CUSTOMER", { Attribute{ "string", "name", "PK" } } } };
    const std::string expected =
        "┌────────────────┐\n"
        "│ CUSTOMER       │\n"
        "├────────────────┤\n"
        "│ string name PK │\n"
        "└────────────────┘";
    EXPECT_EQ(render(d), expected);
}

TEST(ErLayout, NonIdentifyingRelationshipIsDotted) {
    ErDiagram d;
    d.entities = { Entity{ "A", {} }, Entity{ "B", {} } };
    d.relationships = { relation("A", "B", Cardinality::OneOrMany, Cardinality::ExactlyOne, "", false) };
    const std::string out = render(d);
    EXPECT_NE(out.find("│ A │}|╌╌╌╌||│ B │"), std::string::npos) << out;
}

TEST(ErLayout, CardinalitySymbols) {
    ErDiagram d;
    d.entities = { Entity{ "A", {} }, Entity{ "B", {} } };
    d.relationships = { relation("A", "B", Cardinality::ZeroOrOne, Cardinality::OneOrMany) };
    const std::string out = render(d);
    EXPECT_NE(out.find("│ A │|o────|{│ B │"), std::string::npos) << out;
}

TEST(ErLayout, RelationshipSkippingARankRunsBelow) {
    ErDiagram d;
    d.relationships = {
        relation("A", "BBBBBBBBBB", Cardinality::ExactlyOne, Cardinality::ZeroOrMany, "x"),
        relation("BBBBBBBBBB", "C", Cardinality::ExactlyOne, Cardinality::ZeroOrMany, "y"),
        relation("A", "C", Cardinality::ExactlyOne, Cardinality::ZeroOrMany, "zz"),
    };
    const std::string expected =
        "┌───┐         ┌────────────┐         ┌───┐\n"
        "│ A │||┬─x──o{│ BBBBBBBBBB │||──y─┬o{│ C │\n"
        "└───┘  │      └────────────┘      │  └───┘\n"
        "       │            zz            │\n"
        "       └──────────────────────────┘";
    EXPECT_EQ(render(d), expected);

    auto placed = place_er_diagram(d);
    ASSERT_TRUE(placed);
    EXPECT_TRUE(placed->relationships[0].detour.empty());
    EXPECT_FALSE(placed->relationships[2].detour.empty());
    EXPECT_EQ(placed->height, 5);
}

TEST(ErLayout, LabelWidensTheGap) {
    auto placed = place_er_diagram(customer_orders());
    ASSERT_TRUE(placed);
    EXPECT_EQ(placed->width, 35);
    EXPECT_EQ(placed->find_entity("ORDER")->rect.x, 26);
}

TEST(ErLayout, EntitiesOfOneRankStackVertically) {
    ErDiagram d;
    d.relationships = {
        relation("A", "B", Cardinality::ExactlyOne, Cardinality::ExactlyOne),
        relation("A", "C", Cardinality::ExactlyOne, Cardinality::ExactlyOne),
    };
    auto placed = place_er_diagram(d);
    ASSERT_TRUE(placed);
    const auto* b = placed->find_entity("B");
    const auto* c = placed->find_entity("C");
    ASSERT_TRUE(b && c);
    EXPECT_EQ(b->rect.x, c->rect.x);
    EXPECT_EQ(c->rect.y, b->rect.bottom() + 2);
    EXPECT_EQ(placed->height, 7);
}

TEST(ErLayout, RelationshipEndpointsBecomeEntities) {
    ErDiagram d;
    d.relationships = { relation("X", "Y", Cardinality::ExactlyOne, Cardinality::ExactlyOne) };
    auto placed = place_er_diagram(d);
    ASSERT_TRUE(placed);
    EXPECT_NE(placed->find_entity("X"), nullptr);
    EXPECT_NE(placed->find_entity("Y"), nullptr);
}

TEST(ErLayout, AttributeRowJoinsNonEmptyParts) {
    EXPECT_EQ(diagram_placement::attribute_row(Attribute{ "int", "id", "PK, FK" }), "int id PK, FK");
    EXPECT_EQ(diagram_placement::attribute_row(Attribute{ "int", "id", "" }), "int id");
}

TEST(ErLayout, EmptyDiagramIsAnError) {
    LayoutError err;
    EXPECT_FALSE(place_er_diagram(ErDiagram{}, std::nullopt, &err));
    EXPECT_EQ(err.kind, LayoutErrorKind::EmptyDiagram);
    EXPECT_EQ(err.message, "no entities found");
}

TEST(ErLayout, TooWideIsReportedNotShrunk) {
    LayoutError err;
    EXPECT_FALSE(place_er_diagram(customer_orders(), 34, &err));
    EXPECT_EQ(err.kind, LayoutErrorKind::InfeasibleWidth);
    EXPECT_EQ(err.min_width, 35);
    EXPECT_EQ(err.message, "diagram too wide: needs at least 35 columns but max width is 34");
    EXPECT_TRUE(place_er_diagram(customer_orders(), 35));
}
