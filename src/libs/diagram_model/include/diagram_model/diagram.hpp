#pragma once

#include <diagram_model/er_diagram.hpp>
#include <diagram_model/sequence_diagram.hpp>
#include <diagram_model/types.hpp>
#include <variant>

namespace diagram_model {

using AnyDiagram = std::variant<SequenceDiagram, GraphDiagram, ErDiagram>;

} // namespace diagram_model
