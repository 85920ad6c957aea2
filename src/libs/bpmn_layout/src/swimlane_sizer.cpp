#include <bpmn_layout/swimlane_sizer.hpp>
#include <bpmn_model/shape_types.hpp>
#include <algorithm>
#include <limits>

namespace bpmn_layout {

SwimlaneSizer::SwimlaneSizer(double padding)
    : padding_(padding)
{
}

Size SwimlaneSizer::calculate_pool_size(const bpmn_model::Pool& pool,
    const std::vector<bpmn_model::Shape>& shapes) const
{
    if (pool.has_size()) return { *pool.width, *pool.height };

    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();
    bool any = false;
    for (const auto& s : shapes) {
        if (!s.has_position()) continue;
        const auto [dw, dh] = bpmn_model::default_dimensions(s.type);
        min_x = std::min(min_x, *s.x);
        min_y = std::min(min_y, *s.y);
        max_x = std::max(max_x, *s.x + s.width.value_or(dw));
        max_y = std::max(max_y, *s.y + s.height.value_or(dh));
        any = true;
    }

    double width = layout::default_pool_width;
    double height = layout::default_pool_height;
    if (any) {
        width = max_x - min_x + padding_ * 2 + layout::pool_header_width;
        height = max_y - min_y + padding_ * 2;
    }
    return { std::max(width, layout::min_pool_width), std::max(height, layout::min_pool_height) };
}

std::unordered_map<std::string, Rect> SwimlaneSizer::calculate_lane_sizes(const bpmn_model::Pool& pool,
    const std::vector<bpmn_model::Lane>& lanes) const
{
    std::unordered_map<std::string, Rect> out;
    if (lanes.empty()) return out;

    const double pool_width = pool.width.value_or(layout::default_pool_width);
    const double pool_height = pool.height.value_or(layout::default_pool_height);
    const double lane_width = pool_width - layout::pool_header_width;
    const double lane_height = pool_height / static_cast<double>(lanes.size());

    double y = 0;
    for (const auto& lane : lanes) {
        if (lane.has_size())
            out[lane.id] = { layout::pool_header_width, y, *lane.width, *lane.height };
        else
            out[lane.id] = { layout::pool_header_width, y, lane_width, lane_height };
        y += lane_height;
    }
    return out;
}

} // namespace bpmn_layout
