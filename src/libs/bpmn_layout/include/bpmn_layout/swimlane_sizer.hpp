#pragma once

#include <bpmn_layout/layout_constants.hpp>
#include <bpmn_layout/types.hpp>
#include <bpmn_model/model.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace bpmn_layout {

// Pool and lane rectangles derived from their content.
class SwimlaneSizer {
public:
    explicit SwimlaneSizer(double padding = layout::lane_padding);

    // Explicit pool size wins. Otherwise the bounding box of the positioned shapes plus
    // padding (and the header on X), floored at the minimum pool size.
    Size calculate_pool_size(const bpmn_model::Pool& pool, const std::vector<bpmn_model::Shape>& shapes) const;

    // Pool-relative lane rectangles: header offset on X, lanes stacked on Y, pool height split
    // evenly. Lanes that declare their own size keep it.
    std::unordered_map<std::string, Rect> calculate_lane_sizes(const bpmn_model::Pool& pool,
        const std::vector<bpmn_model::Lane>& lanes) const;

private:
    double padding_;
};

} // namespace bpmn_layout
