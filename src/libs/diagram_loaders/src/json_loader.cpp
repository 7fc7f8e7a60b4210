#include <diagram_loaders/json_loader.hpp>
#include "json_fields.hpp"

#include <spdlog/spdlog.h>
#include <fstream>
#include <unordered_set>

namespace diagram_loaders {

namespace {

std::optional<diagram_model::Node::Shape> shape_from_string(const std::string& s) {
    if (s.empty() || s == "box") return diagram_model::Node::Shape::Box;
    if (s == "round") return diagram_model::Node::Shape::Round;
    if (s == "circle") return diagram_model::Node::Shape::Circle;
    if (s == "diamond") return diagram_model::Node::Shape::Diamond;
    return std::nullopt;
}

std::optional<diagram_model::EdgeStyle> style_from_string(const std::string& s) {
    if (s.empty() || s == "arrow") return diagram_model::EdgeStyle::Arrow;
    if (s == "open") return diagram_model::EdgeStyle::OpenLink;
    if (s == "dotted_arrow") return diagram_model::EdgeStyle::DottedArrow;
    if (s == "dotted") return diagram_model::EdgeStyle::DottedLink;
    if (s == "thick_arrow") return diagram_model::EdgeStyle::ThickArrow;
    if (s == "thick") return diagram_model::EdgeStyle::ThickLink;
    return std::nullopt;
}

std::optional<diagram_model::AnyDiagram> fail(std::string* error, const std::string& detail) {
    if (error) *error = "invalid JSON diagram: " + detail;
    return std::nullopt;
}

} // namespace

std::optional<diagram_model::GraphDiagram> graph_from_json(const nlohmann::json& j, std::string& error) {
    diagram_model::GraphDiagram d;
    const std::string direction = string_field(j, "direction", "TD");
    if (direction == "TD" || direction == "TB") {
        d.direction = diagram_model::Direction::TopDown;
    } else if (direction == "LR") {
        d.direction = diagram_model::Direction::LeftRight;
    } else {
        error = "unknown direction \"" + direction + "\"";
        return std::nullopt;
    }

    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        error = "graph needs a \"nodes\" array";
        return std::nullopt;
    }
    std::unordered_set<std::string> known;
    for (const auto& n : j["nodes"]) {
        diagram_model::Node node;
        if (!n.contains("id") || !n["id"].is_string()) {
            error = "node without a string \"id\"";
            return std::nullopt;
        }
        node.id = n["id"].get<std::string>();
        node.label = string_field(n, "label", node.id);
        const auto shape = shape_from_string(string_field(n, "shape"));
        if (!shape) {
            error = "node " + node.id + " has unknown shape \"" + string_field(n, "shape") + "\"";
            return std::nullopt;
        }
        node.shape = *shape;
        known.insert(node.id);
        d.nodes.push_back(std::move(node));
    }

    if (j.contains("edges") && j["edges"].is_array()) {
        for (const auto& e : j["edges"]) {
            diagram_model::Edge edge;
            if (!e.contains("source") || !e["source"].is_string() || !e.contains("target") || !e["target"].is_string()) {
                error = "edge without string \"source\" and \"target\"";
                return std::nullopt;
            }
            edge.source_node_id = e["source"].get<std::string>();
            edge.target_node_id = e["target"].get<std::string>();
            edge.label = string_field(e, "label");
            const auto style = style_from_string(string_field(e, "style"));
            if (!style) {
                error = "edge " + edge.source_node_id + " -> " + edge.target_node_id + " has unknown style \""
                    + string_field(e, "style") + "\"";
                return std::nullopt;
            }
            edge.style = *style;
            if (!known.count(edge.source_node_id) || !known.count(edge.target_node_id))
                spdlog::warn("edge {} -> {} references an undeclared node", edge.source_node_id, edge.target_node_id);
            d.edges.push_back(std::move(edge));
        }
    }

    if (j.contains("subgraphs") && j["subgraphs"].is_array()) {
        for (const auto& s : j["subgraphs"]) {
            diagram_model::Subgraph sg;
            sg.label = string_field(s, "label");
            sg.id = string_field(s, "id", sg.label);
            if (s.contains("nodes") && s["nodes"].is_array()) {
                for (const auto& id : s["nodes"])
                    if (id.is_string()) sg.node_ids.push_back(id.get<std::string>());
            }
            d.subgraphs.push_back(std::move(sg));
        }
    }
    return d;
}

std::optional<diagram_model::AnyDiagram> load_diagram_from_json(std::istream& in, std::string* error) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object()) return fail(error, "top level must be an object");
        const std::string kind = string_field(j, "kind");
        std::string detail;
        if (kind == "graph") {
            if (auto d = graph_from_json(j, detail)) return diagram_model::AnyDiagram(std::move(*d));
        } else if (kind == "er") {
            if (auto d = er_from_json(j, detail)) return diagram_model::AnyDiagram(std::move(*d));
        } else if (kind == "sequence") {
            if (auto d = sequence_from_json(j, detail)) return diagram_model::AnyDiagram(std::move(*d));
        } else {
            detail = "unknown kind \"" + kind + "\"";
        }
        return fail(error, detail);
    } catch (const nlohmann::json::exception& e) {
        return fail(error, e.what());
    }
}

std::optional<diagram_model::AnyDiagram> load_diagram_from_json_file(const std::string& path, std::string* error) {
    std::ifstream f(path);
    if (!f) {
        if (error) *error = "cannot open " + path;
        return std::nullopt;
    }
    return load_diagram_from_json(f, error);
}

} // namespace diagram_loaders
