#pragma once

#include <bpmn_layout/flow_graph.hpp>
#include <bpmn_layout/types.hpp>
#include <stdexcept>
#include <string>

namespace bpmn_layout {

class ExternalLayoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Positions as reported by an external tool: top-left corners in the tool's
// own units, Y axis pointing up.
struct RawLayout {
    PositionMap positions;
    double width = 0;  // bounding box, when the tool reports one
    double height = 0;
};

// Strategy for whole-graph layout. Implementations throw on failure
// (ExternalLayoutError or any std::exception); callers fall back.
class ExternalLayoutEngine {
public:
    virtual ~ExternalLayoutEngine() = default;
    virtual RawLayout compute(const FlowGraph& graph, const SizeMap& sizes, Direction direction) const = 0;
};

// Runs Graphviz `dot -Tplain` as a child process.
class GraphvizLayoutEngine : public ExternalLayoutEngine {
public:
    explicit GraphvizLayoutEngine(std::string executable = "dot");

    RawLayout compute(const FlowGraph& graph, const SizeMap& sizes, Direction direction) const override;

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};

// DOT source for the graph: strict digraph, fixed-size boxes (pixels / 72 inches).
std::string write_dot(const FlowGraph& graph, const SizeMap& sizes, Direction direction);

// Parses Graphviz plain output. Node centres become top-left corners (inches, Y up).
// Throws ExternalLayoutError on malformed input.
RawLayout parse_plain_output(const std::string& text);

// Places graph nodes missing from `raw` in a column right of the reported bounding box.
void complete_raw_layout(RawLayout& raw, const FlowGraph& graph, const SizeMap& sizes);

} // namespace bpmn_layout
