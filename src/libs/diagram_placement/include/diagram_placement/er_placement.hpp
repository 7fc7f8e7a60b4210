#pragma once

#include <diagram_model/er_diagram.hpp>
#include <diagram_placement/layout_error.hpp>
#include <diagram_placement/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace diagram_placement {

struct PlacedEntity {
    std::string name;
    Rect rect;
    int center_x = 0;
    int center_y = 0; // name row, where relationships attach
    int rank = 0;
    std::vector<std::string> attribute_rows;
};

struct PlacedRelationship {
    std::string from;
    std::string to;
    diagram_model::Cardinality left_cardinality = diagram_model::Cardinality::ExactlyOne;
    diagram_model::Cardinality right_cardinality = diagram_model::Cardinality::ExactlyOne;
    std::string label;
    bool identifying = true;
    // Lane route below the entities in between, for relationships that skip
    // a rank. Runs from just right of the left entity to just left of the
    // right one.
    std::vector<GridPoint> detour;
};

struct PlacedErDiagram {
    std::vector<PlacedEntity> entities;
    std::vector<PlacedRelationship> relationships;
    int width = 0;
    int height = 0;

    const PlacedEntity* find_entity(const std::string& name) const {
        for (const auto& e : entities)
            if (e.name == name) return &e;
        return nullptr;
    }
};

std::string attribute_row(const diagram_model::Attribute& attribute);

// Left-to-right ranked layout over the relationship graph. ER diagrams are
// not shrunk: exceeding max_width is reported as an infeasible width.
std::optional<PlacedErDiagram> place_er_diagram(const diagram_model::ErDiagram& diagram,
    std::optional<int> max_width = std::nullopt, LayoutError* error = nullptr);

} // namespace diagram_placement
