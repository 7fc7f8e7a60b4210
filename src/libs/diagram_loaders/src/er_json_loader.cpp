#include "json_fields.hpp"

#include <spdlog/spdlog.h>
#include <unordered_set>

namespace diagram_loaders {

namespace {

std::optional<diagram_model::Cardinality> cardinality_from_string(const std::string& s) {
    if (s.empty() || s == "exactly_one") return diagram_model::Cardinality::ExactlyOne;
    if (s == "zero_or_one") return diagram_model::Cardinality::ZeroOrOne;
    if (s == "one_or_many") return diagram_model::Cardinality::OneOrMany;
    if (s == "zero_or_many") return diagram_model::Cardinality::ZeroOrMany;
    return std::nullopt;
}

diagram_model::Attribute parse_attribute(const nlohmann::json& a) {
    diagram_model::Attribute attr;
    attr.type = string_field(a, "type");
    attr.name = string_field(a, "name");
    attr.key = string_field(a, "key");
    return attr;
}

} // namespace

std::optional<diagram_model::ErDiagram> er_from_json(const nlohmann::json& j, std::string& error) {
    diagram_model::ErDiagram out;
    if (!j.contains("entities") || !j["entities"].is_array()) {
        error = "ER diagram needs an \"entities\" array";
        return std::nullopt;
    }

    std::unordered_set<std::string> known;
    for (const auto& e : j["entities"]) {
        diagram_model::Entity entity;
        if (!e.contains("name") || !e["name"].is_string()) {
            error = "entity without a string \"name\"";
            return std::nullopt;
        }
        entity.name = e["name"].get<std::string>();
        if (e.contains("attributes") && e["attributes"].is_array()) {
            for (const auto& a : e["attributes"])
                entity.attributes.push_back(parse_attribute(a));
        }
        if (known.insert(entity.name).second) out.entities.push_back(std::move(entity));
    }

    if (j.contains("relationships") && j["relationships"].is_array()) {
        for (const auto& r : j["relationships"]) {
            diagram_model::Relationship rel;
            if (!r.contains("from") || !r["from"].is_string() || !r.contains("to") || !r["to"].is_string()) {
                error = "relationship without string \"from\" and \"to\"";
                return std::nullopt;
            }
            rel.from = r["from"].get<std::string>();
            rel.to = r["to"].get<std::string>();
            rel.label = string_field(r, "label");
            rel.identifying = bool_field(r, "identifying", true);
            const auto left = cardinality_from_string(string_field(r, "left"));
            const auto right = cardinality_from_string(string_field(r, "right"));
            if (!left || !right) {
                error = "relationship " + rel.from + " -> " + rel.to + " has an unknown cardinality";
                return std::nullopt;
            }
            rel.left_cardinality = *left;
            rel.right_cardinality = *right;
            // Endpoints that were never declared become attribute-less entities.
            for (const std::string* name : { &rel.from, &rel.to }) {
                if (known.insert(*name).second) {
                    spdlog::warn("relationship references undeclared entity {}", *name);
                    out.entities.push_back({ *name, {} });
                }
            }
            out.relationships.push_back(std::move(rel));
        }
    }
    return out;
}

} // namespace diagram_loaders
