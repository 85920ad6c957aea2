#include <bpmn_layout/flow_layout.hpp>
#include <bpmn_layout/layout_constants.hpp>
#include <algorithm>
#include <map>

namespace bpmn_layout {

namespace {

Size size_of(const SizeMap& sizes, const std::string& id) {
    const auto it = sizes.find(id);
    return it != sizes.end() ? it->second : Size{ 120.0, 80.0 };
}

} // namespace

PositionMap fallback_flow_layout(const std::vector<std::string>& shape_ids, const FlowGraph& graph,
    const RankMap& ranks, const SizeMap& sizes, Direction direction)
{
    PositionMap out;
    const bool horizontal = is_horizontal(direction);

    std::map<int, std::vector<std::string>> by_rank;
    std::vector<std::string> outside_graph;
    for (const auto& id : shape_ids) {
        if (!graph.contains(id)) {
            outside_graph.push_back(id);
            continue;
        }
        const auto it = ranks.find(id);
        by_rank[it != ranks.end() ? it->second : 0].push_back(id);
    }

    std::vector<const std::vector<std::string>*> rank_order;
    for (const auto& [rank, ids] : by_rank)
        rank_order.push_back(&ids);
    if (is_reversed(direction)) std::reverse(rank_order.begin(), rank_order.end());

    double primary = layout::diagram_margin;
    double flow_bottom = 0;
    for (const auto* ids : rank_order) {
        double extent = 0;
        for (const auto& id : *ids) {
            const Size s = size_of(sizes, id);
            extent = std::max(extent, horizontal ? s.width : s.height);
        }

        double secondary = layout::diagram_margin;
        for (const auto& id : *ids) {
            const Size s = size_of(sizes, id);
            const double along = horizontal ? s.width : s.height;
            const double across = horizontal ? s.height : s.width;
            const double p = primary + (extent - along) / 2;
            const Point pos = horizontal ? Point{ p, secondary } : Point{ secondary, p };
            out[id] = pos;
            flow_bottom = std::max(flow_bottom, pos.y + s.height);
            secondary += across + layout::node_separation;
        }
        primary += extent + layout::rank_separation;
    }

    if (!outside_graph.empty()) {
        const double grid_y = out.empty() ? layout::diagram_margin : flow_bottom + layout::node_vertical_gap;
        for (const auto& [id, p] : grid_layout(outside_graph, sizes, { layout::diagram_margin, grid_y }))
            out[id] = p;
    }
    return out;
}

PositionMap grid_layout(const std::vector<std::string>& shape_ids, const SizeMap& sizes, Point origin) {
    PositionMap out;
    double x = origin.x;
    double y = origin.y;
    double row_height = 0;
    std::size_t column = 0;
    for (const auto& id : shape_ids) {
        if (column == layout::grid_columns) {
            x = origin.x;
            y += row_height + layout::node_vertical_gap;
            row_height = 0;
            column = 0;
        }
        const Size s = size_of(sizes, id);
        out[id] = { x, y };
        x += s.width + layout::node_horizontal_gap;
        row_height = std::max(row_height, s.height);
        ++column;
    }
    return out;
}

} // namespace bpmn_layout
