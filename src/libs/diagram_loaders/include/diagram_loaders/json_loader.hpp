#pragma once

#include <diagram_model/diagram.hpp>
#include <optional>
#include <istream>
#include <string>

namespace diagram_loaders {

// Decodes { "kind": "sequence" | "graph" | "er", ... } into a diagram AST.
// Failures return nullopt with "invalid JSON diagram: ..." in `error`.
std::optional<diagram_model::AnyDiagram> load_diagram_from_json(std::istream& in, std::string* error = nullptr);
std::optional<diagram_model::AnyDiagram> load_diagram_from_json_file(const std::string& path,
    std::string* error = nullptr);

} // namespace diagram_loaders
