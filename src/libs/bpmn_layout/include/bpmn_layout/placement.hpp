#pragma once

#include <bpmn_layout/flow_graph.hpp>
#include <bpmn_layout/types.hpp>
#include <bpmn_model/model.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace bpmn_layout {

// Absolute extent of everything that already has coordinates.
struct DiagramBounds {
    double min_x = 0;
    double min_y = 0;
    double max_x = 0;
    double max_y = 0;
};

// Union of positioned shapes, pools and lanes; {50, 50, 800, 600} when nothing is positioned.
DiagramBounds compute_bounds(const bpmn_model::Model& model);

// Moves `candidate` until a box of `size` there no longer intersects any of `placed`.
// Steps down by overlap_step; when the next step would pass bounds.max_y, shifts right by
// width + gap and restarts at the candidate's y. Gives up after max_overlap_attempts
// and returns the least-overlapping candidate seen.
Point avoid_overlap(Point candidate, Size size, const std::vector<Rect>& placed, const DiagramBounds& bounds);

// Shapes that are endpoints of a graph edge, plus shapes nested (at any depth) in a
// sub-container that is. Model order.
std::vector<std::string> find_connected_shapes(const bpmn_model::Model& model, const FlowGraph& graph);

// Places each unpositioned shape of `ids` next to a positioned predecessor (to its right)
// or successor (to its left), repeating until nothing changes or 2 x shape count passes.
// Only missing coordinates are filled. Returns the number of shapes placed.
std::size_t place_connected_shapes(bpmn_model::Model& model, const FlowGraph& graph,
    const std::vector<std::string>& ids, const DiagramBounds& bounds);

// Data shapes go to a sidebar left of the diagram, everything else to a row below it.
void place_disconnected_shapes(bpmn_model::Model& model, const std::vector<std::string>& ids);

// Last resort for shapes still missing x or y: rows of grid_columns below the diagram.
// Returns the number of shapes touched.
std::size_t assign_fallback_positions(bpmn_model::Model& model);

} // namespace bpmn_layout
