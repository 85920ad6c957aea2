#include <bpmn_layout/position_resolver.hpp>
#include <bpmn_layout/coordinate_normalizer.hpp>
#include <bpmn_layout/flow_layout.hpp>
#include <bpmn_layout/layout_constants.hpp>
#include <bpmn_layout/logging.hpp>
#include <bpmn_layout/placement.hpp>
#include <bpmn_model/shape_types.hpp>
#include <exception>
#include <unordered_set>

namespace bpmn_layout {

PositionResolver::PositionResolver(LayoutOptions options, const ExternalLayoutEngine* engine)
    : options_(options)
    , engine_(engine)
{
}

bpmn_model::Model PositionResolver::resolve(const bpmn_model::Model& input) const {
    bpmn_model::Model model = input;
    layout_logger()->debug("Resolving {} shapes, {} connectors, {} pools, {} lanes (layout={}, direction={})",
        model.shapes.size(), model.connectors.size(), model.pools.size(), model.lanes.size(),
        to_string(options_.mode), to_string(options_.direction));

    const PoolStacking stacking = assign_pool_positions(model);

    for (auto& s : model.shapes) {
        const auto [w, h] = bpmn_model::default_dimensions(s.type);
        if (!s.width) s.width = w;
        if (!s.height) s.height = h;
    }

    std::vector<std::string> needs_layout;
    bool any_positioned = false;
    for (const auto& s : model.shapes) {
        if (s.has_position())
            any_positioned = true;
        else
            needs_layout.push_back(s.id);
    }

    const FlowGraph graph = build_flow_graph(model.shapes, model.connectors);
    const bool explicit_coordinates = model.has_explicit_coordinates || any_positioned;

    if (!needs_layout.empty() && !explicit_coordinates && options_.mode == LayoutMode::UseExternalTool) {
        layout_whole_model(model, graph);
    } else if (!needs_layout.empty()) {
        const auto connected_ids = find_connected_shapes(model, graph);
        const std::unordered_set<std::string> connected(connected_ids.begin(), connected_ids.end());
        std::vector<std::string> to_place;
        std::vector<std::string> disconnected;
        for (const auto& id : needs_layout)
            (connected.count(id) ? to_place : disconnected).push_back(id);

        if (!to_place.empty()) place_connected_shapes(model, graph, to_place, compute_bounds(model));
        place_disconnected_shapes(model, disconnected);
    }

    assign_fallback_positions(model);
    ContainmentResolver(options_).resolve(model, stacking);
    return model;
}

PoolStacking PositionResolver::assign_pool_positions(bpmn_model::Model& model) const {
    PoolStacking stacking;
    double next_x = layout::default_pool_x;
    double next_y = layout::default_pool_y;
    double lowest_bottom = 0;
    bool any_positioned = false;
    for (const auto& p : model.pools) {
        if (p.has_size()) stacking.explicit_size.insert(p.id);
        if (!p.has_position()) continue;
        const double bottom = *p.y + p.height.value_or(layout::default_pool_height);
        if (!any_positioned || bottom > lowest_bottom) {
            lowest_bottom = bottom;
            next_x = *p.x;
            next_y = bottom + layout::pool_gap;
        }
        any_positioned = true;
    }

    for (auto& p : model.pools) {
        if (p.has_position()) continue;
        if (!p.x) p.x = next_x;
        if (!p.y) p.y = next_y;
        if (!p.width) p.width = layout::default_pool_width;
        if (!p.height) p.height = layout::default_pool_height;
        next_y = *p.y + *p.height + layout::pool_gap;
        stacking.stacked.push_back(p.id);
    }
    return stacking;
}

void PositionResolver::layout_whole_model(bpmn_model::Model& model, const FlowGraph& graph) const {
    SizeMap sizes;
    for (const auto& s : model.shapes)
        sizes[s.id] = { *s.width, *s.height };

    PositionMap positions;
    if (engine_) {
        try {
            RawLayout raw = engine_->compute(graph, sizes, options_.direction);
            for (auto it = raw.positions.begin(); it != raw.positions.end();) {
                if (graph.contains(it->first))
                    ++it;
                else
                    it = raw.positions.erase(it);
            }
            complete_raw_layout(raw, graph, sizes);
            positions = normalize_positions(raw.positions, true, true);
        } catch (const std::exception& e) {
            layout_logger()->warn("External layout failed, using fallback layout: {}", e.what());
            positions.clear();
        }
    } else {
        layout_logger()->debug("No external layout engine configured, using fallback layout");
    }

    if (positions.empty()) {
        const RankMap ranks = assign_ranks(graph);
        positions = normalize_positions(
            fallback_flow_layout(graph.nodes, graph, ranks, sizes, options_.direction), false, false);
    }

    for (auto& s : model.shapes) {
        const auto it = positions.find(s.id);
        if (it == positions.end()) continue;
        if (!s.x) s.x = it->second.x;
        if (!s.y) s.y = it->second.y;
    }
}

bpmn_model::Model resolve_positions(const bpmn_model::Model& model, const LayoutOptions& options,
    const ExternalLayoutEngine* engine)
{
    return PositionResolver(options, engine).resolve(model);
}

} // namespace bpmn_layout
