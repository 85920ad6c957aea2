#pragma once

#include <bpmn_layout/types.hpp>

namespace bpmn_layout {

// Translates raw positions so the minimum lands at the diagram margin.
// flip_y: raw Y axis points up (external tool output), mirror it around the maximum.
// apply_scale: raw units are inches, multiply by the pixel scale.
PositionMap normalize_positions(const PositionMap& raw, bool flip_y, bool apply_scale);

} // namespace bpmn_layout
