#include <bpmn_layout/placement.hpp>
#include <bpmn_layout/layout_constants.hpp>
#include <bpmn_layout/logging.hpp>
#include <bpmn_model/shape_types.hpp>
#include <algorithm>
#include <limits>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace bpmn_layout {

namespace {

Size size_of(const bpmn_model::Shape& s) {
    const auto [w, h] = bpmn_model::default_dimensions(s.type);
    return { s.width.value_or(w), s.height.value_or(h) };
}

Rect rect_of(const bpmn_model::Shape& s) {
    const Size size = size_of(s);
    return { *s.x, *s.y, size.width, size.height };
}

void fill_missing(bpmn_model::Shape& s, Point p) {
    if (!s.x) s.x = p.x;
    if (!s.y) s.y = p.y;
}

class BoundsAccumulator {
public:
    void add(double x, double y, double w, double h) {
        min_x_ = std::min(min_x_, x);
        min_y_ = std::min(min_y_, y);
        max_x_ = std::max(max_x_, x + w);
        max_y_ = std::max(max_y_, y + h);
        empty_ = false;
    }

    DiagramBounds bounds() const {
        if (empty_)
            return { layout::default_bounds_min_x, layout::default_bounds_min_y,
                layout::default_bounds_max_x, layout::default_bounds_max_y };
        return { min_x_, min_y_, max_x_, max_y_ };
    }

private:
    bool empty_ = true;
    double min_x_ = std::numeric_limits<double>::max();
    double min_y_ = std::numeric_limits<double>::max();
    double max_x_ = std::numeric_limits<double>::lowest();
    double max_y_ = std::numeric_limits<double>::lowest();
};

Point right_of(const bpmn_model::Shape& pred, Size size, const DiagramBounds& bounds) {
    const Rect p = rect_of(pred);
    Point pos{ p.right() + layout::node_horizontal_gap, p.y + (p.height - size.height) / 2 };
    if (pos.x + size.width > bounds.max_x) {
        pos.x = bounds.min_x;
        pos.y = p.bottom() + layout::node_vertical_gap;
    }
    return pos;
}

Point left_of(const bpmn_model::Shape& succ, Size size, const DiagramBounds& bounds) {
    const Rect s = rect_of(succ);
    Point pos{ s.x - size.width - layout::node_horizontal_gap, s.y + (s.height - size.height) / 2 };
    if (pos.x < bounds.min_x) {
        pos.x = s.x;
        pos.y = std::max(0.0, s.y - size.height - layout::node_vertical_gap);
    }
    return pos;
}

} // namespace

DiagramBounds compute_bounds(const bpmn_model::Model& model) {
    BoundsAccumulator acc;
    for (const auto& s : model.shapes) {
        if (!s.has_position()) continue;
        acc.add(*s.x, *s.y, s.width.value_or(0), s.height.value_or(0));
    }
    for (const auto& p : model.pools) {
        if (!p.has_position()) continue;
        acc.add(*p.x, *p.y, p.width.value_or(0), p.height.value_or(0));
    }
    for (const auto& l : model.lanes) {
        if (!l.has_position()) continue;
        acc.add(*l.x, *l.y, l.width.value_or(0), l.height.value_or(0));
    }
    return acc.bounds();
}

Point avoid_overlap(Point candidate, Size size, const std::vector<Rect>& placed, const DiagramBounds& bounds) {
    Point current = candidate;
    Point best = candidate;
    double best_overlap = std::numeric_limits<double>::max();

    for (int attempt = 0; attempt < layout::max_overlap_attempts; ++attempt) {
        const Rect box{ current.x, current.y, size.width, size.height };
        bool collides = false;
        double total = 0;
        for (const auto& r : placed) {
            if (!intersects(box, r)) continue;
            collides = true;
            total += overlap_area(box, r);
        }
        if (!collides) return current;
        if (total < best_overlap) {
            best_overlap = total;
            best = current;
        }

        if (current.y + layout::overlap_step > bounds.max_y) {
            current.x += size.width + layout::node_horizontal_gap;
            current.y = candidate.y;
        } else {
            current.y += layout::overlap_step;
        }
    }

    layout_logger()->debug("No free spot near ({}, {}) after {} attempts, accepting ({}, {})",
        candidate.x, candidate.y, layout::max_overlap_attempts, best.x, best.y);
    return best;
}

std::vector<std::string> find_connected_shapes(const bpmn_model::Model& model, const FlowGraph& graph) {
    std::unordered_map<std::string, std::string> container_of;
    for (const auto& s : model.shapes) {
        if (auto c = bpmn_model::sub_container_of(s)) container_of[s.id] = *c;
    }

    std::vector<std::string> out;
    for (const auto& s : model.shapes) {
        if (graph.is_connected(s.id)) {
            out.push_back(s.id);
            continue;
        }
        // Nested shapes follow their container; bounded walk guards against reference cycles.
        std::string current = s.id;
        for (std::size_t depth = 0; depth < model.shapes.size(); ++depth) {
            const auto it = container_of.find(current);
            if (it == container_of.end()) break;
            current = it->second;
            if (graph.is_connected(current)) {
                out.push_back(s.id);
                break;
            }
        }
    }
    return out;
}

std::size_t place_connected_shapes(bpmn_model::Model& model, const FlowGraph& graph,
    const std::vector<std::string>& ids, const DiagramBounds& bounds)
{
    std::unordered_map<std::string, bpmn_model::Shape*> by_id;
    std::vector<Rect> placed;
    for (auto& s : model.shapes) {
        by_id[s.id] = &s;
        if (s.has_position()) placed.push_back(rect_of(s));
    }

    auto positioned = [&by_id](const std::string& id) -> const bpmn_model::Shape* {
        const auto it = by_id.find(id);
        if (it == by_id.end() || !it->second->has_position()) return nullptr;
        return it->second;
    };

    std::size_t total = 0;
    const std::size_t max_passes = 2 * model.shapes.size();
    for (std::size_t pass = 0; pass < max_passes; ++pass) {
        std::size_t placed_this_pass = 0;
        for (const auto& id : ids) {
            const auto it = by_id.find(id);
            if (it == by_id.end() || it->second->has_position()) continue;
            bpmn_model::Shape& shape = *it->second;
            const Size size = size_of(shape);

            std::optional<Point> candidate;
            for (const auto& pred : graph.predecessors_of(id)) {
                if (const auto* p = positioned(pred)) {
                    candidate = right_of(*p, size, bounds);
                    break;
                }
            }
            if (!candidate) {
                for (const auto& succ : graph.successors_of(id)) {
                    if (const auto* s = positioned(succ)) {
                        candidate = left_of(*s, size, bounds);
                        break;
                    }
                }
            }
            if (!candidate) continue;

            fill_missing(shape, avoid_overlap(*candidate, size, placed, bounds));
            placed.push_back(rect_of(shape));
            ++placed_this_pass;
        }
        total += placed_this_pass;
        if (placed_this_pass == 0) break;
    }

    layout_logger()->debug("Neighbor placement positioned {} of {} shapes", total, ids.size());
    return total;
}

void place_disconnected_shapes(bpmn_model::Model& model, const std::vector<std::string>& ids) {
    if (ids.empty()) return;
    const DiagramBounds bounds = compute_bounds(model);

    double sidebar_y = bounds.min_y;
    double row_x = bounds.min_x;
    double row_y = bounds.max_y + layout::disconnected_row_gap;
    double row_height = 0;

    for (const auto& id : ids) {
        bpmn_model::Shape* shape = model.find_shape(id);
        if (!shape || shape->has_position()) continue;
        const Size size = size_of(*shape);

        if (bpmn_model::is_data_type(shape->type)) {
            fill_missing(*shape, { bounds.min_x - size.width - layout::sidebar_gap, sidebar_y });
            sidebar_y += size.height + layout::sidebar_vertical_gap;
            continue;
        }

        if (row_x > bounds.min_x && row_x + size.width > bounds.max_x) {
            row_x = bounds.min_x;
            row_y += row_height + layout::disconnected_row_gap;
            row_height = 0;
        }
        fill_missing(*shape, { row_x, row_y });
        row_x += size.width + layout::node_horizontal_gap;
        row_height = std::max(row_height, size.height);
    }
}

std::size_t assign_fallback_positions(bpmn_model::Model& model) {
    std::vector<bpmn_model::Shape*> missing;
    for (auto& s : model.shapes) {
        if (!s.has_position()) missing.push_back(&s);
    }
    if (missing.empty()) return 0;

    const DiagramBounds bounds = compute_bounds(model);
    layout_logger()->info("{} shapes still unpositioned, placing them below the diagram", missing.size());

    double x = bounds.min_x;
    double y = bounds.max_y + layout::fallback_row_gap;
    double row_height = 0;
    std::size_t column = 0;
    for (auto* s : missing) {
        if (column == layout::grid_columns) {
            x = bounds.min_x;
            y += row_height + layout::fallback_row_gap;
            row_height = 0;
            column = 0;
        }
        const Size size = size_of(*s);
        fill_missing(*s, { x, y });
        x += size.width + layout::node_horizontal_gap;
        row_height = std::max(row_height, size.height);
        ++column;
    }
    return missing.size();
}

} // namespace bpmn_layout
