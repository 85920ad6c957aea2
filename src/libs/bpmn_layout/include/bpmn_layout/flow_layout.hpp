#pragma once

#include <bpmn_layout/flow_graph.hpp>
#include <bpmn_layout/types.hpp>
#include <string>
#include <vector>

namespace bpmn_layout {

// In-process layered layout used when no external engine is available or it failed.
// Ranks advance along the primary axis (X for LR/RL, Y for TB/BT), nodes of one rank
// stack along the secondary axis in encounter order. Ids not in the graph go to a grid
// below the flow block. Returns top-left pixel positions starting at the diagram margin.
PositionMap fallback_flow_layout(const std::vector<std::string>& shape_ids, const FlowGraph& graph,
    const RankMap& ranks, const SizeMap& sizes, Direction direction);

// Row-wrapping grid (grid_columns per row) starting at `origin`.
PositionMap grid_layout(const std::vector<std::string>& shape_ids, const SizeMap& sizes, Point origin);

} // namespace bpmn_layout
