#pragma once

#include <bpmn_layout/containment.hpp>
#include <bpmn_layout/external_layout.hpp>
#include <bpmn_layout/types.hpp>
#include <bpmn_model/model.hpp>

namespace bpmn_layout {

// Fills in every missing position and size, then makes coordinates container-relative.
// The input model is never modified; resolving the same input twice gives the same output.
class PositionResolver {
public:
    // engine may be null: whole-model layout then always uses the in-process fallback.
    explicit PositionResolver(LayoutOptions options, const ExternalLayoutEngine* engine = nullptr);

    bpmn_model::Model resolve(const bpmn_model::Model& model) const;

    const LayoutOptions& options() const { return options_; }

private:
    PoolStacking assign_pool_positions(bpmn_model::Model& model) const;
    void layout_whole_model(bpmn_model::Model& model, const FlowGraph& graph) const;

    LayoutOptions options_;
    const ExternalLayoutEngine* engine_;
};

bpmn_model::Model resolve_positions(const bpmn_model::Model& model, const LayoutOptions& options = {},
    const ExternalLayoutEngine* engine = nullptr);

} // namespace bpmn_layout
