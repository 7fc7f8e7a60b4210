#include <mermaid_ascii/render.hpp>
#include <diagram_loaders/mermaid_parser.hpp>
#include <diagram_placement/er_placement.hpp>
#include <diagram_placement/placer.hpp>
#include <diagram_placement/sequence_placement.hpp>
#include <diagram_render/renderer.hpp>
#include <spdlog/spdlog.h>

namespace mermaid_ascii {

namespace {

// Runs one layout engine and its renderer, translating the layout error.
class DiagramRenderer {
public:
    DiagramRenderer(const RenderOptions& options, std::string* error)
        : options_(options), error_(error)
    {
    }

    std::optional<std::string> operator()(const diagram_model::SequenceDiagram& d) const {
        diagram_placement::LayoutError err;
        auto placed = diagram_placement::place_sequence(d, options_.max_width, &err);
        if (!placed) return fail(err);
        return diagram_render::render_sequence_diagram(*placed);
    }

    std::optional<std::string> operator()(const diagram_model::GraphDiagram& d) const {
        diagram_placement::LayoutError err;
        auto placed = diagram_placement::place_diagram(d, options_.max_width, &err);
        if (!placed) return fail(err);
        return diagram_render::render_diagram(*placed);
    }

    std::optional<std::string> operator()(const diagram_model::ErDiagram& d) const {
        diagram_placement::LayoutError err;
        auto placed = diagram_placement::place_er_diagram(d, options_.max_width, &err);
        if (!placed) return fail(err);
        return diagram_render::render_er_diagram(*placed);
    }

private:
    std::optional<std::string> fail(const diagram_placement::LayoutError& err) const {
        spdlog::debug("layout failed: {}", err.message);
        if (error_) *error_ = err.message;
        return std::nullopt;
    }

    const RenderOptions& options_;
    std::string* error_;
};

} // namespace

std::optional<std::string> render_diagram(const diagram_model::AnyDiagram& diagram, const RenderOptions& options,
    std::string* error) {
    return std::visit(DiagramRenderer(options, error), diagram);
}

std::optional<std::string> render_with_options(std::string_view source, const RenderOptions& options,
    std::string* error) {
    auto diagram = diagram_loaders::parse_diagram(source, error);
    if (!diagram) return std::nullopt;
    return render_diagram(*diagram, options, error);
}

std::optional<std::string> render(std::string_view source, std::string* error) {
    return render_with_options(source, RenderOptions{}, error);
}

} // namespace mermaid_ascii
