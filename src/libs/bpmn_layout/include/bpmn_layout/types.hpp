#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bpmn_layout {

struct Point {
    double x = 0;
    double y = 0;
};

struct Size {
    double width = 0;
    double height = 0;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

// Strict intersection: rectangles that only touch do not overlap.
inline bool intersects(const Rect& a, const Rect& b) {
    return a.x < b.right() && a.right() > b.x && a.y < b.bottom() && a.bottom() > b.y;
}

inline double overlap_area(const Rect& a, const Rect& b) {
    const double w = std::min(a.right(), b.right()) - std::max(a.x, b.x);
    const double h = std::min(a.bottom(), b.bottom()) - std::max(a.y, b.y);
    if (w <= 0 || h <= 0) return 0;
    return w * h;
}

// Shape id -> top-left corner.
using PositionMap = std::unordered_map<std::string, Point>;
// Shape id -> width/height.
using SizeMap = std::unordered_map<std::string, Size>;

enum class Direction { LeftToRight, TopToBottom, RightToLeft, BottomToTop };

enum class LayoutMode {
    UseExternalTool, // compute missing positions, external tool first
    Preserve         // keep upstream coordinates, only convert coordinate spaces
};

struct LayoutOptions {
    LayoutMode mode = LayoutMode::UseExternalTool;
    Direction direction = Direction::LeftToRight;
};

inline bool is_horizontal(Direction d) {
    return d == Direction::LeftToRight || d == Direction::RightToLeft;
}

inline bool is_reversed(Direction d) {
    return d == Direction::RightToLeft || d == Direction::BottomToTop;
}

std::optional<Direction> parse_direction(std::string_view s);
std::optional<LayoutMode> parse_layout_mode(std::string_view s);
// "LR", "TB", "RL", "BT"
const char* to_string(Direction d);
// "graphviz", "preserve"
const char* to_string(LayoutMode m);

} // namespace bpmn_layout
