#pragma once

#include <string>

namespace diagram_placement {

enum class LayoutErrorKind { EmptyDiagram, InfeasibleWidth, UnsupportedShape };

struct LayoutError {
    LayoutErrorKind kind = LayoutErrorKind::EmptyDiagram;
    std::string message;
    int min_width = 0; // 0 when unknown
};

} // namespace diagram_placement
