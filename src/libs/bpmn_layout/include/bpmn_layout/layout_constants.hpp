#pragma once

#include <cstddef>

namespace bpmn_layout {

// Shared layout constants (resolver, fallback layout, containment).
// All values in pixels unless noted.

namespace layout {

constexpr double diagram_margin = 50.0;

// Graphviz input: inches, sizes converted from pixels at 72 per inch.
constexpr double graphviz_nodesep = 0.8;
constexpr double graphviz_ranksep = 1.2;
constexpr double graphviz_points_per_inch = 72.0;
// Graphviz output: pixels per inch on the way back.
constexpr double scale_x = 100.0;
constexpr double scale_y = 100.0;

constexpr double node_horizontal_gap = 60.0;
constexpr double node_vertical_gap = 80.0;
constexpr double rank_separation = 120.0;
constexpr double node_separation = 60.0;
constexpr std::size_t grid_columns = 5;

// Bounding box used when nothing in the model has coordinates yet.
constexpr double default_bounds_min_x = 50.0;
constexpr double default_bounds_min_y = 50.0;
constexpr double default_bounds_max_x = 800.0;
constexpr double default_bounds_max_y = 600.0;

constexpr double overlap_step = 100.0;
constexpr int max_overlap_attempts = 20;

constexpr double sidebar_gap = 40.0;
constexpr double sidebar_vertical_gap = 20.0;
constexpr double disconnected_row_gap = 50.0;
constexpr double fallback_row_gap = 100.0;

// Swimlanes.
constexpr double pool_header_width = 40.0;
constexpr double lane_padding = 20.0;
constexpr double lane_min_height = 120.0;
constexpr double pool_gap = 50.0;
constexpr double default_pool_x = 50.0;
constexpr double default_pool_y = 50.0;
constexpr double default_pool_width = 600.0;
constexpr double default_pool_height = 200.0;
constexpr double min_pool_width = 400.0;
constexpr double min_pool_height = 150.0;
// Horizontal extent used for lanes when no shape has an X.
constexpr double default_extent_min_x = 50.0;
constexpr double default_extent_max_x = 800.0;

// Collapsible container header (sub-processes).
constexpr double container_header_height = 26.0;

// Boundary shapes on their host's bottom edge.
constexpr double boundary_first_offset = 20.0;
constexpr double boundary_spacing = 50.0;

constexpr double sibling_nudge_step = 10.0;

// Lane band usable for shapes once padding and the tallest shape are taken out.
inline constexpr double lane_usable_height(double lane_height, double max_shape_height) {
    const double usable = lane_height - 2.0 * lane_padding - max_shape_height;
    return usable > 0.0 ? usable : 0.0;
}

inline constexpr double lane_height_for(double max_shape_height) {
    const double h = max_shape_height + 3.0 * lane_padding;
    return h > lane_min_height ? h : lane_min_height;
}

} // namespace layout
} // namespace bpmn_layout
