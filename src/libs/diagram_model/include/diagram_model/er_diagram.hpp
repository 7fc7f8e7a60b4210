#pragma once

#include <string>
#include <vector>

namespace diagram_model {

enum class Cardinality { ExactlyOne, ZeroOrOne, OneOrMany, ZeroOrMany };

struct Attribute {
    std::string type;
    std::string name;
    std::string key; // "PK", "FK", "PK, FK" or empty
};

struct Entity {
    std::string name;
    std::vector<Attribute> attributes;
};

struct Relationship {
    std::string from;
    std::string to;
    Cardinality left_cardinality = Cardinality::ExactlyOne;
    Cardinality right_cardinality = Cardinality::ExactlyOne;
    std::string label;
    bool identifying = true; // "--" when true, ".." otherwise
};

struct ErDiagram {
    std::vector<Entity> entities;
    std::vector<Relationship> relationships;
};

} // namespace diagram_model
