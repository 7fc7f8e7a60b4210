#pragma once

#include <diagram_model/er_diagram.hpp>
#include <diagram_model/sequence_diagram.hpp>
#include <diagram_model/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace diagram_loaders {

inline std::string string_field(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

inline bool bool_field(const nlohmann::json& j, const char* key, bool fallback = false) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

// Each decoder leaves a detail in `error` when it returns nullopt.
std::optional<diagram_model::GraphDiagram> graph_from_json(const nlohmann::json& j, std::string& error);
std::optional<diagram_model::ErDiagram> er_from_json(const nlohmann::json& j, std::string& error);
std::optional<diagram_model::SequenceDiagram> sequence_from_json(const nlohmann::json& j, std::string& error);

} // namespace diagram_loaders
