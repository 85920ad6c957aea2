#pragma once

#include <bpmn_model/model.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace bpmn_layout {

// Directed flow graph over shape ids. Built per resolve call, never cached.
struct FlowGraph {
    std::vector<std::string> nodes; // in shape order
    std::unordered_map<std::string, std::vector<std::string>> successors;
    std::unordered_map<std::string, std::vector<std::string>> predecessors;
    std::size_t edge_count = 0;

    bool contains(const std::string& id) const { return successors.find(id) != successors.end(); }
    // True if the node has at least one incoming or outgoing edge.
    bool is_connected(const std::string& id) const;
    const std::vector<std::string>& successors_of(const std::string& id) const;
    const std::vector<std::string>& predecessors_of(const std::string& id) const;
};

using RankMap = std::unordered_map<std::string, int>;

// One node per shape; one edge per connector whose endpoints both exist (duplicates collapse).
// Connectors with unknown endpoints are skipped with a warning.
FlowGraph build_flow_graph(const std::vector<bpmn_model::Shape>& shapes,
    const std::vector<bpmn_model::Connector>& connectors);

// Longest-path rank from the sources. Tolerates cycles: ranks are capped at
// node_count - 1 and propagation stops after node_count^2 steps (logged).
// Nodes never reached get rank 0.
RankMap assign_ranks(const FlowGraph& graph);

} // namespace bpmn_layout
