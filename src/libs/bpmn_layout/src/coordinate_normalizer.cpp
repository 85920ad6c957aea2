#include <bpmn_layout/coordinate_normalizer.hpp>
#include <bpmn_layout/layout_constants.hpp>
#include <algorithm>
#include <limits>

namespace bpmn_layout {

PositionMap normalize_positions(const PositionMap& raw, bool flip_y, bool apply_scale) {
    PositionMap out;
    if (raw.empty()) return out;

    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_y = std::numeric_limits<double>::lowest();
    for (const auto& [id, p] : raw) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }

    const double sx = apply_scale ? layout::scale_x : 1.0;
    const double sy = apply_scale ? layout::scale_y : 1.0;
    for (const auto& [id, p] : raw) {
        const double x = (p.x - min_x) * sx + layout::diagram_margin;
        const double y = flip_y ? (max_y - p.y) * sy + layout::diagram_margin
                                : (p.y - min_y) * sy + layout::diagram_margin;
        out[id] = { x, y };
    }
    return out;
}

} // namespace bpmn_layout
