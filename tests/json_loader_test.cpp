#include <diagram_loaders/json_loader.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace diagram_model;
using diagram_loaders::load_diagram_from_json;

namespace {

std::optional<AnyDiagram> load(const std::string& text, std::string* error = nullptr) {
    std::istringstream in(text);
    return load_diagram_from_json(in, error);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST(JsonLoader, Graph) {
    std::string error;
    auto d = load(R"({
        "kind": "graph",
        "direction": "LR",
        "nodes": [
            { "id": "A", "label": "Start", "shape": "round" },
            { "id": "B", "shape": "diamond" }
        ],
        "edges": [ { "source": "A", "target": "B", "style": "dotted_arrow", "label": "go" } ],
        "subgraphs": [ { "id": "g", "label": "Group", "nodes": [ "A" ] } ]
    })", &error);
    ASSERT_TRUE(d) << error;
    const auto& g = std::get<GraphDiagram>(*d);
    EXPECT_EQ(g.direction, Direction::LeftRight);
    ASSERT_EQ(g.nodes.size(), 2u);
    EXPECT_EQ(g.nodes[0].label, "Start");
    EXPECT_EQ(g.nodes[0].shape, Node::Shape::Round);
    EXPECT_EQ(g.nodes[1].label, "B");
    ASSERT_EQ(g.edges.size(), 1u);
    EXPECT_EQ(g.edges[0].style, EdgeStyle::DottedArrow);
    EXPECT_EQ(g.edges[0].label, "go");
    ASSERT_EQ(g.subgraphs.size(), 1u);
    EXPECT_EQ(g.subgraphs[0].node_ids, std::vector<std::string>{ "A" });
}

TEST(JsonLoader, ErDiagram) {
    std::string error;
    auto d = load(R"({
        "kind": "er",
        "entities": [ { "name": "CUSTOMER", "attributes": [ { "type": "string", "name": "name", "key": "PK" } ] } ],
        "relationships": [
            { "from": "CUSTOMER", "to": "ORDER", "left": "exactly_one", "right": "zero_or_many",
              "label": "places", "identifying": false }
        ]
    })", &error);
    ASSERT_TRUE(d) << error;
    const auto& er = std::get<ErDiagram>(*d);
    ASSERT_EQ(er.entities.size(), 2u);
    EXPECT_EQ(er.entities[0].attributes[0].key, "PK");
    EXPECT_EQ(er.entities[1].name, "ORDER");
    ASSERT_EQ(er.relationships.size(), 1u);
    EXPECT_EQ(er.relationships[0].right_cardinality, Cardinality::ZeroOrMany);
    EXPECT_FALSE(er.relationships[0].identifying);
}

TEST(JsonLoader, SequenceWithNestedBlock) {
    std::string error;
    auto d = load(R"({
        "kind": "sequence",
        "statements": [
            { "type": "participant", "id": "A", "alias": "Alice" },
            { "type": "autonumber" },
            { "type": "block", "kind": "alt", "label": "ok",
              "body": [ { "type": "message", "from": "A", "to": "B", "text": "hi", "line": "dotted", "head": "cross" } ],
              "branches": [ { "label": "fail", "body": [ { "type": "note", "placement": "over", "participants": [ "A", "B" ], "text": "n" } ] } ] },
            { "type": "destroy", "id": "B" }
        ]
    })", &error);
    ASSERT_TRUE(d) << error;
    const auto& seq = std::get<SequenceDiagram>(*d);
    ASSERT_EQ(seq.statements.size(), 4u);
    EXPECT_EQ(std::get<ParticipantDecl>(seq.statements[0]).display_name(), "Alice");
    const auto& block = std::get<Block>(seq.statements[2]);
    EXPECT_EQ(block.kind, BlockKind::Alt);
    const auto& msg = std::get<Message>(block.body[0]);
    EXPECT_EQ(msg.arrow.line, LineStyle::Dotted);
    EXPECT_EQ(msg.arrow.head, ArrowHead::Cross);
    ASSERT_EQ(block.branches.size(), 1u);
    EXPECT_EQ(std::get<Note>(block.branches[0].body[0]).participants.size(), 2u);
    EXPECT_EQ(std::get<Destroy>(seq.statements[3]).id, "B");
}

TEST(JsonLoader, MalformedJson) {
    std::string error;
    EXPECT_FALSE(load("{ \"kind\": ", &error));
    EXPECT_TRUE(starts_with(error, "invalid JSON diagram: ")) << error;
}

TEST(JsonLoader, SemanticErrors) {
    std::string error;
    EXPECT_FALSE(load("[1, 2]", &error));
    EXPECT_EQ(error, "invalid JSON diagram: top level must be an object");

    EXPECT_FALSE(load(R"({ "kind": "pie" })", &error));
    EXPECT_EQ(error, "invalid JSON diagram: unknown kind \"pie\"");

    EXPECT_FALSE(load(R"({ "kind": "graph" })", &error));
    EXPECT_EQ(error, "invalid JSON diagram: graph needs a \"nodes\" array");

    EXPECT_FALSE(load(R"({ "kind": "graph", "nodes": [ { "label": "x" } ] })", &error));
    EXPECT_EQ(error, "invalid JSON diagram: node without a string \"id\"");

    EXPECT_FALSE(load(R"({ "kind": "graph", "nodes": [ { "id": "A", "shape": "hexagon" } ] })", &error));
    EXPECT_EQ(error, "invalid JSON diagram: node A has unknown shape \"hexagon\"");

    EXPECT_FALSE(load(R"({ "kind": "er", "entities": [], "relationships": [ { "from": "A", "to": "B", "left": "many" } ] })",
        &error));
    EXPECT_EQ(error, "invalid JSON diagram: relationship A -> B has an unknown cardinality");

    EXPECT_FALSE(load(R"({ "kind": "sequence", "statements": [ { "type": "wave" } ] })", &error));
    EXPECT_EQ(error, "invalid JSON diagram: unknown statement type \"wave\"");

    EXPECT_FALSE(load(R"({ "kind": "sequence", "statements": [ { "type": "note", "participants": [] } ] })", &error));
    EXPECT_EQ(error, "invalid JSON diagram: note needs one or two participants");
}

TEST(JsonLoader, MissingFile) {
    std::string error;
    EXPECT_FALSE(diagram_loaders::load_diagram_from_json_file("/nonexistent/diagram.json", &error));
    EXPECT_EQ(error, "cannot open /nonexistent/diagram.json");
}
