#include <bpmn_layout/types.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace bpmn_layout {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<Direction> parse_direction(std::string_view s) {
    const std::string v = to_lower(s);
    if (v == "lr" || v == "left-to-right") return Direction::LeftToRight;
    if (v == "tb" || v == "top-to-bottom") return Direction::TopToBottom;
    if (v == "rl" || v == "right-to-left") return Direction::RightToLeft;
    if (v == "bt" || v == "bottom-to-top") return Direction::BottomToTop;
    return std::nullopt;
}

std::optional<LayoutMode> parse_layout_mode(std::string_view s) {
    const std::string v = to_lower(s);
    if (v == "graphviz" || v == "use-external-tool") return LayoutMode::UseExternalTool;
    if (v == "preserve") return LayoutMode::Preserve;
    return std::nullopt;
}

const char* to_string(Direction d) {
    switch (d) {
    case Direction::LeftToRight: return "LR";
    case Direction::TopToBottom: return "TB";
    case Direction::RightToLeft: return "RL";
    case Direction::BottomToTop: return "BT";
    }
    return "LR";
}

const char* to_string(LayoutMode m) {
    switch (m) {
    case LayoutMode::UseExternalTool: return "graphviz";
    case LayoutMode::Preserve: return "preserve";
    }
    return "graphviz";
}

} // namespace bpmn_layout
