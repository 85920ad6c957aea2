#include <bpmn_layout/containment.hpp>
#include <bpmn_layout/layout_constants.hpp>
#include <bpmn_layout/logging.hpp>
#include <bpmn_layout/swimlane_sizer.hpp>
#include <bpmn_model/shape_types.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <numbers>
#include <utility>

namespace bpmn_layout {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Absolute rectangles of every shape, taken before any conversion.
using Snapshot = std::unordered_map<std::string, Rect>;

Snapshot take_snapshot(const bpmn_model::Model& model) {
    Snapshot out;
    for (const auto& s : model.shapes) {
        const auto [dw, dh] = bpmn_model::default_dimensions(s.type);
        out[s.id] = { s.x.value_or(0), s.y.value_or(0), s.width.value_or(dw), s.height.value_or(dh) };
    }
    return out;
}

bool has_lanes(const bpmn_model::Pool& pool, const bpmn_model::Model& model) {
    if (!pool.lane_ids.empty()) return true;
    return std::any_of(model.lanes.begin(), model.lanes.end(),
        [&pool](const bpmn_model::Lane& l) { return l.pool_id == pool.id; });
}

// Position of a lane in its pool's lane_ids; unlisted lanes sort last, keeping model order.
std::size_t declared_index(const bpmn_model::Pool* pool, const std::string& lane_id) {
    if (!pool) return 0;
    const auto it = std::find(pool->lane_ids.begin(), pool->lane_ids.end(), lane_id);
    return static_cast<std::size_t>(std::distance(pool->lane_ids.begin(), it));
}

std::string remove_all(std::string s, const std::string& what) {
    for (auto pos = s.find(what); pos != std::string::npos; pos = s.find(what, pos))
        s.erase(pos, what.size());
    return s;
}

// Shapes whose resolved parent is a lane / pool, in model order.
std::vector<bpmn_model::Shape*> lane_members(bpmn_model::Model& model, const ParentMap& parents, const std::string& lane_id) {
    std::vector<bpmn_model::Shape*> out;
    for (auto& s : model.shapes) {
        const auto* ref = std::get_if<LaneParent>(&parents.at(s.id));
        if (ref && ref->lane_id == lane_id) out.push_back(&s);
    }
    return out;
}

std::vector<bpmn_model::Shape*> pool_members(bpmn_model::Model& model, const ParentMap& parents, const std::string& pool_id) {
    std::vector<bpmn_model::Shape*> out;
    for (auto& s : model.shapes) {
        const auto* ref = std::get_if<PoolParent>(&parents.at(s.id));
        if (ref && ref->pool_id == pool_id) out.push_back(&s);
    }
    return out;
}

std::vector<bpmn_model::Shape> snapshot_copies(const std::vector<bpmn_model::Shape*>& shapes, const Snapshot& snapshot) {
    std::vector<bpmn_model::Shape> out;
    for (const auto* s : shapes) {
        bpmn_model::Shape copy = *s;
        const Rect& r = snapshot.at(s->id);
        copy.x = r.x;
        copy.y = r.y;
        copy.width = r.width;
        copy.height = r.height;
        out.push_back(std::move(copy));
    }
    return out;
}

// Lanes stacked from y = 0 in each pool, members remapped into their lane's band.
void organize_lanes(bpmn_model::Model& model, const ParentMap& parents, const Snapshot& snapshot) {
    const double padding = layout::lane_padding;

    double min_x = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    for (const auto& [id, r] : snapshot) {
        min_x = std::min(min_x, r.x);
        max_x = std::max(max_x, r.right());
    }
    if (snapshot.empty()) {
        min_x = layout::default_extent_min_x;
        max_x = layout::default_extent_max_x;
    }
    const double lane_width = max_x - min_x + padding * 2;

    // Pool id -> lanes, pools in order of first appearance, lanes in lane_ids order.
    std::vector<std::pair<std::string, std::vector<bpmn_model::Lane*>>> groups;
    for (auto& lane : model.lanes) {
        auto it = std::find_if(groups.begin(), groups.end(),
            [&lane](const auto& g) { return g.first == lane.pool_id; });
        if (it == groups.end()) {
            groups.push_back({ lane.pool_id, {} });
            it = std::prev(groups.end());
        }
        it->second.push_back(&lane);
    }
    for (auto& [pool_id, lanes] : groups) {
        const bpmn_model::Pool* pool = model.find_pool(pool_id);
        std::stable_sort(lanes.begin(), lanes.end(), [pool](const bpmn_model::Lane* a, const bpmn_model::Lane* b) {
            return declared_index(pool, a->id) < declared_index(pool, b->id);
        });
    }

    std::unordered_map<std::string, double> pool_heights;
    for (auto& [pool_id, lanes] : groups) {
        double y = 0;
        for (auto* lane : lanes) {
            const auto members = lane_members(model, parents, lane->id);
            double max_h = 0;
            for (const auto* m : members)
                max_h = std::max(max_h, snapshot.at(m->id).height);
            const double lane_h = members.empty() ? layout::lane_min_height : layout::lane_height_for(max_h);

            lane->x = layout::pool_header_width;
            lane->y = y;
            lane->width = lane_width;
            lane->height = lane_h;
            y += lane_h;

            if (members.empty()) continue;
            double min_y = std::numeric_limits<double>::max();
            double max_y = std::numeric_limits<double>::lowest();
            for (const auto* m : members) {
                min_y = std::min(min_y, snapshot.at(m->id).y);
                max_y = std::max(max_y, snapshot.at(m->id).y);
            }
            const double range = max_y - min_y;
            const double usable = layout::lane_usable_height(lane_h, max_h);
            for (auto* m : members) {
                const Rect& r = snapshot.at(m->id);
                m->x = r.x - min_x + padding;
                m->y = range > 0 ? padding + (r.y - min_y) / range * usable : (lane_h - r.height) / 2;
            }
        }
        if (!pool_id.empty()) pool_heights[pool_id] = y;
    }

    for (auto& pool : model.pools) {
        const auto it = pool_heights.find(pool.id);
        if (it == pool_heights.end()) continue;
        pool.width = lane_width + layout::pool_header_width;
        pool.height = it->second;
    }
}

// Pools without lanes: sized around their members, members centred vertically.
void organize_pool_members(bpmn_model::Model& model, const ParentMap& parents, const Snapshot& snapshot,
    const PoolStacking& stacking)
{
    const SwimlaneSizer sizer;
    for (auto& pool : model.pools) {
        const auto members = pool_members(model, parents, pool.id);
        const bool laneless = !has_lanes(pool, model);
        if (laneless && !stacking.explicit_size.count(pool.id)) {
            bpmn_model::Pool unsized = pool;
            unsized.width.reset();
            unsized.height.reset();
            const Size size = sizer.calculate_pool_size(unsized, snapshot_copies(members, snapshot));
            pool.width = size.width;
            pool.height = size.height;
        }
        if (members.empty()) continue;

        double min_x = std::numeric_limits<double>::max();
        for (const auto* m : members)
            min_x = std::min(min_x, snapshot.at(m->id).x);
        const double pool_h = pool.height.value_or(layout::default_pool_height);
        for (auto* m : members) {
            const Rect& r = snapshot.at(m->id);
            m->x = r.x - min_x + layout::lane_padding + layout::pool_header_width;
            m->y = (pool_h - r.height) / 2;
        }
    }
}

// Upstream coordinates kept; lanes become pool-relative and members lane- or pool-relative.
void convert_preserved(bpmn_model::Model& model, const ParentMap& parents, const Snapshot& snapshot) {
    const SwimlaneSizer sizer;

    std::unordered_map<std::string, Point> lane_origin;
    for (const auto& lane : model.lanes) {
        if (lane.has_position()) lane_origin[lane.id] = { *lane.x, *lane.y };
    }

    for (auto& pool : model.pools) {
        if (!pool.has_size()) {
            const Size size = sizer.calculate_pool_size(pool, snapshot_copies(pool_members(model, parents, pool.id), snapshot));
            pool.width = size.width;
            pool.height = size.height;
        }

        std::vector<bpmn_model::Lane> pool_lanes;
        bool any_unsized = false;
        for (auto& lane : model.lanes) {
            if (lane.pool_id != pool.id) continue;
            pool_lanes.push_back(lane);
            any_unsized = any_unsized || !lane.has_size();
            if (pool.has_position() && lane.has_position()) {
                lane.x = *lane.x - *pool.x;
                lane.y = *lane.y - *pool.y;
            }
        }
        if (any_unsized) {
            std::stable_sort(pool_lanes.begin(), pool_lanes.end(),
                [&pool](const bpmn_model::Lane& a, const bpmn_model::Lane& b) {
                    return declared_index(&pool, a.id) < declared_index(&pool, b.id);
                });
            const auto rects = sizer.calculate_lane_sizes(pool, pool_lanes);
            for (auto& lane : model.lanes) {
                const auto it = rects.find(lane.id);
                if (it == rects.end() || lane.has_size()) continue;
                lane.width = it->second.width;
                lane.height = it->second.height;
            }
        }

        if (!pool.has_position()) continue;
        for (auto* m : pool_members(model, parents, pool.id)) {
            const Rect& r = snapshot.at(m->id);
            m->x = r.x - *pool.x;
            m->y = r.y - *pool.y;
        }
    }

    for (auto& lane : model.lanes) {
        const auto origin = lane_origin.find(lane.id);
        if (origin == lane_origin.end()) continue;
        for (auto* m : lane_members(model, parents, lane.id)) {
            const Rect& r = snapshot.at(m->id);
            m->x = r.x - origin->second.x;
            m->y = r.y - origin->second.y;
        }
    }
}

// Pools the resolver stacked are stacked again now that their heights are final.
void restack_pools(bpmn_model::Model& model, const PoolStacking& stacking) {
    if (stacking.stacked.empty()) return;
    const std::unordered_set<std::string> stacked(stacking.stacked.begin(), stacking.stacked.end());

    double next_y = layout::default_pool_y;
    for (const auto& pool : model.pools) {
        if (stacked.count(pool.id) || !pool.has_position()) continue;
        next_y = std::max(next_y, *pool.y + pool.height.value_or(0) + layout::pool_gap);
    }
    for (const auto& id : stacking.stacked) {
        auto it = std::find_if(model.pools.begin(), model.pools.end(),
            [&id](const bpmn_model::Pool& p) { return p.id == id; });
        if (it == model.pools.end()) continue;
        it->y = next_y;
        next_y += it->height.value_or(layout::default_pool_height) + layout::pool_gap;
    }
}

void convert_sub_containers(bpmn_model::Model& model, const ParentMap& parents, const Snapshot& snapshot) {
    for (auto& s : model.shapes) {
        const auto* ref = std::get_if<SubContainerParent>(&parents.at(s.id));
        if (!ref) continue;
        const Rect& c = snapshot.at(ref->container_id);
        const Rect& r = snapshot.at(s.id);
        const double header = layout::container_header_height;
        const double max_x = std::max(0.0, c.width - r.width);
        const double max_y = std::max(0.0, c.height - header - r.height);
        s.x = std::clamp(r.x - c.x, 0.0, max_x);
        s.y = std::clamp(r.y - c.y - header, 0.0, max_y);
    }
}

void position_boundary_shapes(bpmn_model::Model& model, const ParentMap& parents) {
    std::unordered_map<std::string, int> per_host;
    for (auto& s : model.shapes) {
        const auto* ref = std::get_if<HostParent>(&parents.at(s.id));
        if (!ref) continue;
        const bpmn_model::Shape* host = model.find_shape(ref->host_id);
        if (!host) continue;
        const int index = per_host[ref->host_id]++;
        const double host_h = host->height.value_or(bpmn_model::default_dimensions(host->type).second);
        const double h = s.height.value_or(bpmn_model::default_dimensions(s.type).second);
        s.x = layout::boundary_first_offset + index * layout::boundary_spacing;
        s.y = host_h - h / 2;
    }
}

// Inner size of the container a shape is placed in; nullopt when unbounded.
std::optional<Size> interior_of(const ParentRef& ref, const bpmn_model::Model& model) {
    return std::visit(overloaded{
        [](const NoParent&) -> std::optional<Size> { return std::nullopt; },
        [&model](const LaneParent& p) -> std::optional<Size> {
            const auto* lane = model.find_lane(p.lane_id);
            if (!lane || !lane->has_size()) return std::nullopt;
            return Size{ *lane->width, *lane->height };
        },
        [&model](const PoolParent& p) -> std::optional<Size> {
            const auto* pool = model.find_pool(p.pool_id);
            if (!pool || !pool->has_size()) return std::nullopt;
            return Size{ *pool->width, *pool->height };
        },
        [&model](const SubContainerParent& p) -> std::optional<Size> {
            const auto* c = model.find_shape(p.container_id);
            if (!c || !c->has_size()) return std::nullopt;
            return Size{ *c->width, *c->height - layout::container_header_height };
        },
        [](const HostParent&) -> std::optional<Size> { return std::nullopt; },
    }, ref);
}

// Offsets, in nudge steps, on the square ring at distance k: nearest first, then clockwise
// starting from the right (screen coordinates, +y down).
std::vector<Point> ring_offsets(int k) {
    std::vector<Point> out;
    for (int dx = -k; dx <= k; ++dx) {
        for (int dy = -k; dy <= k; ++dy) {
            if (std::max(std::abs(dx), std::abs(dy)) == k)
                out.push_back({ static_cast<double>(dx), static_cast<double>(dy) });
        }
    }
    auto angle = [](const Point& p) {
        const double a = std::atan2(p.y, p.x);
        return a < 0 ? a + 2 * std::numbers::pi : a;
    };
    std::sort(out.begin(), out.end(), [&angle](const Point& a, const Point& b) {
        const double da = std::abs(a.x) + std::abs(a.y);
        const double db = std::abs(b.x) + std::abs(b.y);
        if (da != db) return da < db;
        return angle(a) < angle(b);
    });
    return out;
}

// First box around `box`, ring by ring up to `rings`, that is not taken and passes `accept`.
template <class Taken, class Accept>
std::optional<Rect> first_free_box(const Rect& box, std::size_t rings, Taken taken, Accept accept) {
    for (std::size_t k = 1; k <= rings; ++k) {
        for (const auto& d : ring_offsets(static_cast<int>(k))) {
            Rect candidate = box;
            candidate.x += d.x * layout::sibling_nudge_step;
            candidate.y += d.y * layout::sibling_nudge_step;
            if (!taken(candidate) && accept(candidate)) return candidate;
        }
    }
    return std::nullopt;
}

// No two shapes with the same parent keep an identical box.
void separate_siblings(bpmn_model::Model& model, const ParentMap& parents) {
    std::unordered_map<std::string, std::vector<Rect>> occupied;

    for (auto& s : model.shapes) {
        const ParentRef& ref = parents.at(s.id);
        auto& boxes = occupied[parent_id_of(ref)];
        const auto [dw, dh] = bpmn_model::default_dimensions(s.type);
        const Rect box{ s.x.value_or(0), s.y.value_or(0), s.width.value_or(dw), s.height.value_or(dh) };
        auto taken = [&boxes](const Rect& r) { return std::find(boxes.begin(), boxes.end(), r) != boxes.end(); };
        if (!taken(box)) {
            boxes.push_back(box);
            continue;
        }

        std::optional<Rect> moved;
        const auto interior = interior_of(ref, model);
        if (interior && interior->width >= box.width && interior->height >= box.height) {
            const auto rings = static_cast<std::size_t>(
                std::ceil(std::max(interior->width, interior->height) / layout::sibling_nudge_step));
            moved = first_free_box(box, rings, taken, [&interior](const Rect& r) {
                return r.x >= 0 && r.y >= 0 && r.right() <= interior->width && r.bottom() <= interior->height;
            });
            if (!moved)
                layout_logger()->debug("No free box for '{}' inside '{}', placing it past the interior",
                    s.id, parent_id_of(ref));
        }
        // A ring of radius k has 8k boxes, so one beyond boxes.size() always has a free one.
        if (!moved)
            moved = first_free_box(box, boxes.size() + 1, taken, [](const Rect&) { return true; });
        if (!moved) {
            boxes.push_back(box);
            continue;
        }
        s.x = moved->x;
        s.y = moved->y;
        boxes.push_back(*moved);
    }
}

} // namespace

std::string parent_id_of(const ParentRef& ref) {
    return std::visit(overloaded{
        [](const NoParent&) { return std::string(); },
        [](const LaneParent& p) { return p.lane_id; },
        [](const PoolParent& p) { return p.pool_id; },
        [](const SubContainerParent& p) { return p.container_id; },
        [](const HostParent& p) { return p.host_id; },
    }, ref);
}

std::optional<std::string> find_boundary_host(const bpmn_model::Shape& boundary, const bpmn_model::Model& model) {
    if (const auto it = boundary.properties.find("attachedToRef");
        it != boundary.properties.end() && !it->second.empty())
    {
        if (model.find_shape(it->second)) return it->second;
        layout_logger()->warn("Boundary shape '{}' is attached to unknown shape '{}'", boundary.id, it->second);
        return std::nullopt;
    }

    const std::string stripped = remove_all(boundary.id, "Boundary");
    for (const auto& other : model.shapes) {
        if (other.id == boundary.id || !bpmn_model::is_attachable_host_type(other.type)) continue;
        if (boundary.id.find(other.id) != std::string::npos
            || (!stripped.empty() && other.id.find(stripped) != std::string::npos))
            return other.id;
    }
    return std::nullopt;
}

ParentMap analyze_parents(const bpmn_model::Model& model) {
    std::unordered_map<std::string, std::string> lane_of_member;
    for (const auto& lane : model.lanes) {
        for (const auto& m : lane.member_ids)
            lane_of_member.emplace(m, lane.id);
    }

    std::vector<const bpmn_model::Pool*> laneless;
    for (const auto& pool : model.pools) {
        if (!has_lanes(pool, model)) laneless.push_back(&pool);
    }
    const bpmn_model::Pool* only_laneless =
        laneless.size() == 1 && !laneless.front()->process_ref.empty() ? laneless.front() : nullptr;

    ParentMap out;
    for (const auto& s : model.shapes) {
        if (bpmn_model::is_attached_type(s.type)) {
            if (auto host = find_boundary_host(s, model)) {
                out[s.id] = HostParent{ *host };
                continue;
            }
        }

        const auto container = bpmn_model::sub_container_of(s);
        if (container) {
            if (*container != s.id && model.find_shape(*container)) {
                out[s.id] = SubContainerParent{ *container };
                continue;
            }
            layout_logger()->warn("Shape '{}' references unknown container '{}'", s.id, *container);
        }

        if (const auto it = lane_of_member.find(s.id); it != lane_of_member.end()) {
            out[s.id] = LaneParent{ it->second };
            continue;
        }

        if (s.parent_id && !s.parent_id->empty()) {
            const std::string& id = *s.parent_id;
            if (model.find_lane(id)) {
                out[s.id] = LaneParent{ id };
                continue;
            }
            if (model.find_pool(id)) {
                out[s.id] = PoolParent{ id };
                continue;
            }
            if (id != s.id && model.find_shape(id)) {
                out[s.id] = SubContainerParent{ id };
                continue;
            }
            layout_logger()->warn("Shape '{}' has unknown parent '{}', treating it as top level", s.id, id);
        }

        if (only_laneless && !container) {
            out[s.id] = PoolParent{ only_laneless->id };
            continue;
        }
        out[s.id] = NoParent{};
    }
    return out;
}

ContainmentResolver::ContainmentResolver(LayoutOptions options)
    : options_(options)
{
}

void ContainmentResolver::resolve(bpmn_model::Model& model, const PoolStacking& stacking) const {
    const ParentMap parents = analyze_parents(model);
    const Snapshot snapshot = take_snapshot(model);

    const bool lanes_positioned = std::all_of(model.lanes.begin(), model.lanes.end(),
        [](const bpmn_model::Lane& l) { return l.has_position(); });
    const bool preserve = options_.mode == LayoutMode::Preserve && model.has_explicit_coordinates && lanes_positioned;

    if (preserve) {
        convert_preserved(model, parents, snapshot);
    } else {
        if (!model.lanes.empty()) organize_lanes(model, parents, snapshot);
        organize_pool_members(model, parents, snapshot, stacking);
    }
    restack_pools(model, stacking);
    convert_sub_containers(model, parents, snapshot);
    position_boundary_shapes(model, parents);
    separate_siblings(model, parents);

    for (auto& s : model.shapes) {
        std::string parent = parent_id_of(parents.at(s.id));
        if (parent.empty())
            s.parent_id.reset();
        else
            s.parent_id = std::move(parent);
    }
    layout_logger()->debug("Containment resolved for {} shapes ({} mode)", model.shapes.size(),
        preserve ? "preserve" : "layout");
}

} // namespace bpmn_layout
