#pragma once

#include <bpmn_layout/types.hpp>
#include <bpmn_model/model.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace bpmn_layout {

struct NoParent {};
struct LaneParent {
    std::string lane_id;
};
struct PoolParent {
    std::string pool_id;
};
struct SubContainerParent {
    std::string container_id;
};
// Boundary shapes sit on their host's border.
struct HostParent {
    std::string host_id;
};

using ParentRef = std::variant<NoParent, LaneParent, PoolParent, SubContainerParent, HostParent>;

// Shape id -> resolved container.
using ParentMap = std::unordered_map<std::string, ParentRef>;

// Container id a shape's coordinates are relative to; empty for NoParent.
std::string parent_id_of(const ParentRef& ref);

// Resolves every shape's container once: host (boundary shapes), sub-container, lane
// membership, explicit parent id, then the single laneless pool with a process.
// Unknown references are logged and ignored.
ParentMap analyze_parents(const bpmn_model::Model& model);

// Host a boundary shape is attached to: the attachedToRef property, else the first
// attachable shape whose id matches the boundary id.
std::optional<std::string> find_boundary_host(const bpmn_model::Shape& boundary, const bpmn_model::Model& model);

// What the resolver did to the pools before containment runs.
struct PoolStacking {
    std::vector<std::string> stacked;                // pools the resolver placed, in stacking order
    std::unordered_set<std::string> explicit_size;   // pools whose input carried width and height
};

// Converts fully positioned absolute coordinates into container-relative ones and
// sizes lanes and pools around their content.
class ContainmentResolver {
public:
    explicit ContainmentResolver(LayoutOptions options);

    void resolve(bpmn_model::Model& model, const PoolStacking& stacking) const;

private:
    LayoutOptions options_;
};

} // namespace bpmn_layout
