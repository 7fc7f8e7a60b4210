#include <diagram_placement/er_placement.hpp>
#include <diagram_placement/lanes.hpp>
#include <diagram_placement/layout_constants.hpp>
#include <diagram_placement/ranking.hpp>
#include <text_metrics/text_metrics.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <utility>
#include <unordered_set>

namespace diagram_placement {

namespace {

std::vector<diagram_model::Entity> collect_entities(const diagram_model::ErDiagram& diagram) {
    std::vector<diagram_model::Entity> entities = diagram.entities;
    std::unordered_set<std::string> seen;
    for (const auto& e : entities) seen.insert(e.name);
    auto ensure = [&](const std::string& name) {
        if (!seen.insert(name).second) return;
        diagram_model::Entity e;
        e.name = name;
        entities.push_back(std::move(e));
    };
    for (const auto& r : diagram.relationships) {
        ensure(r.from);
        ensure(r.to);
    }
    return entities;
}

// Relationships whose ends have entities between them run along a lane
// below those entities. The lane leaves room for the crow's-foot symbols.
void route_rank_skips(PlacedErDiagram& placed) {
    const int symbol_width = 2;
    std::vector<Rect> boxes;
    for (const auto& e : placed.entities) boxes.push_back(e.rect);
    LaneRouter router(std::move(boxes), {});

    for (auto& pr : placed.relationships) {
        const PlacedEntity* from = placed.find_entity(pr.from);
        const PlacedEntity* to = placed.find_entity(pr.to);
        if (!from || !to) continue;
        if (to->rect.x < from->rect.x) std::swap(from, to);
        const bool skips = std::any_of(placed.entities.begin(), placed.entities.end(), [&](const PlacedEntity& e) {
            return e.rect.x > from->rect.right() && e.rect.right() < to->rect.x;
        });
        if (!skips) continue;
        pr.detour = router.route_below({ from->rect.right() + 1, from->center_y }, { to->rect.x - 1, to->center_y },
            symbol_width, symbol_width);
        for (const auto& p : pr.detour) placed.height = std::max(placed.height, p.row + 1);
    }
}

} // namespace

std::string attribute_row(const diagram_model::Attribute& attribute) {
    std::string row = attribute.type;
    if (!attribute.name.empty()) row += (row.empty() ? "" : " ") + attribute.name;
    if (!attribute.key.empty()) row += (row.empty() ? "" : " ") + attribute.key;
    return row;
}

std::optional<PlacedErDiagram> place_er_diagram(const diagram_model::ErDiagram& diagram,
    std::optional<int> max_width, LayoutError* error)
{
    const std::vector<diagram_model::Entity> entities = collect_entities(diagram);
    if (entities.empty()) {
        if (error) *error = { LayoutErrorKind::EmptyDiagram, "no entities found", 0 };
        return std::nullopt;
    }

    std::vector<std::string> names;
    for (const auto& e : entities) names.push_back(e.name);
    std::vector<std::pair<std::string, std::string>> links;
    for (const auto& r : diagram.relationships) links.emplace_back(r.from, r.to);
    const RankMap ranks = assign_ranks(names, links);

    int max_rank = 0;
    for (const auto& [name, rank] : ranks) max_rank = std::max(max_rank, rank);
    const auto rank_count = static_cast<std::size_t>(max_rank) + 1;

    std::vector<int> gap_after(rank_count, layout::er::min_gap);
    for (const auto& r : diagram.relationships) {
        const int a = ranks.at(r.from);
        const int b = ranks.at(r.to);
        if (std::abs(a - b) != 1) continue;
        const int demand = text_metrics::display_width(r.label) + layout::er::label_margin;
        auto& gap = gap_after[static_cast<std::size_t>(std::min(a, b))];
        gap = std::max(gap, demand);
    }

    PlacedErDiagram out;
    std::vector<std::vector<PlacedEntity>> columns(rank_count);
    for (const auto& e : entities) {
        PlacedEntity pe;
        pe.name = e.name;
        pe.rank = ranks.at(e.name);
        int widest = text_metrics::display_width(e.name);
        for (const auto& a : e.attributes) {
            pe.attribute_rows.push_back(attribute_row(a));
            widest = std::max(widest, text_metrics::display_width(pe.attribute_rows.back()));
        }
        pe.rect.width = widest + layout::box_padding;
        // border, name, border, plus a separator and one row per attribute
        pe.rect.height = 3 + (pe.attribute_rows.empty() ? 0 : 1 + static_cast<int>(pe.attribute_rows.size()));
        columns[static_cast<std::size_t>(pe.rank)].push_back(std::move(pe));
    }

    int x = 0;
    for (std::size_t r = 0; r < rank_count; ++r) {
        if (columns[r].empty()) continue;
        int y = 0;
        int column_width = 0;
        for (auto& pe : columns[r]) {
            pe.rect.x = x;
            pe.rect.y = y;
            pe.center_x = x + pe.rect.width / 2;
            pe.center_y = y + 1;
            y += pe.rect.height + layout::er::vertical_gap;
            column_width = std::max(column_width, pe.rect.width);
            out.height = std::max(out.height, pe.rect.bottom() + 1);
            out.entities.push_back(pe);
        }
        out.width = x + column_width;
        x += column_width + gap_after[r];
    }

    for (const auto& r : diagram.relationships) {
        PlacedRelationship pr;
        pr.from = r.from;
        pr.to = r.to;
        pr.left_cardinality = r.left_cardinality;
        pr.right_cardinality = r.right_cardinality;
        pr.label = r.label;
        pr.identifying = r.identifying;
        out.relationships.push_back(std::move(pr));
    }
    route_rank_skips(out);
    spdlog::debug("er layout: {} entities, {} ranks, width {}", out.entities.size(), rank_count, out.width);

    if (max_width && out.width > *max_width) {
        if (error) {
            *error = { LayoutErrorKind::InfeasibleWidth,
                "diagram too wide: needs at least " + std::to_string(out.width)
                    + " columns but max width is " + std::to_string(*max_width),
                out.width };
        }
        return std::nullopt;
    }
    return out;
}

} // namespace diagram_placement
