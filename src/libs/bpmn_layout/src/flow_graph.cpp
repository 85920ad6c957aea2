#include <bpmn_layout/flow_graph.hpp>
#include <bpmn_layout/logging.hpp>
#include <algorithm>
#include <queue>
#include <unordered_set>
#include <utility>

namespace bpmn_layout {

namespace {

const std::vector<std::string> no_neighbors;

std::string edge_key(const std::string& from, const std::string& to) {
    return from + "->" + to;
}

void add_node(FlowGraph& g, const std::string& id) {
    if (g.contains(id)) return;
    g.nodes.push_back(id);
    g.successors[id];
    g.predecessors[id];
}

void add_edge(FlowGraph& g, std::unordered_set<std::string>& seen,
    const std::string& from, const std::string& to)
{
    if (!seen.insert(edge_key(from, to)).second) return;
    g.successors[from].push_back(to);
    g.predecessors[to].push_back(from);
    ++g.edge_count;
}

} // namespace

bool FlowGraph::is_connected(const std::string& id) const {
    return !successors_of(id).empty() || !predecessors_of(id).empty();
}

const std::vector<std::string>& FlowGraph::successors_of(const std::string& id) const {
    const auto it = successors.find(id);
    return it != successors.end() ? it->second : no_neighbors;
}

const std::vector<std::string>& FlowGraph::predecessors_of(const std::string& id) const {
    const auto it = predecessors.find(id);
    return it != predecessors.end() ? it->second : no_neighbors;
}

FlowGraph build_flow_graph(const std::vector<bpmn_model::Shape>& shapes,
    const std::vector<bpmn_model::Connector>& connectors)
{
    FlowGraph g;
    for (const auto& s : shapes)
        add_node(g, s.id);

    std::unordered_set<std::string> seen;
    for (const auto& c : connectors) {
        const bool has_source = g.contains(c.source_id);
        const bool has_target = g.contains(c.target_id);
        if (!has_source || !has_target) {
            layout_logger()->warn("Skipping connector '{}': unknown {} '{}'",
                c.id, has_source ? "target" : "source", has_source ? c.target_id : c.source_id);
            continue;
        }
        add_edge(g, seen, c.source_id, c.target_id);
    }
    return g;
}

RankMap assign_ranks(const FlowGraph& graph) {
    RankMap ranks;
    if (graph.nodes.empty()) return ranks;

    const std::size_t n = graph.nodes.size();
    const int max_rank = static_cast<int>(n) - 1;
    std::unordered_map<std::string, int> recorded;
    for (const auto& id : graph.nodes)
        recorded[id] = -1;

    std::queue<std::pair<std::string, int>> work;
    for (const auto& id : graph.nodes) {
        if (graph.predecessors_of(id).empty()) work.push({ id, 0 });
    }
    // Fully cyclic: every node is a candidate source.
    if (work.empty()) {
        for (const auto& id : graph.nodes)
            work.push({ id, 0 });
    }

    const std::size_t max_iterations = n * n;
    std::size_t iterations = 0;
    while (!work.empty()) {
        if (iterations >= max_iterations) {
            layout_logger()->warn("Rank assignment stopped after {} iterations ({} nodes); "
                "using ranks found so far", iterations, n);
            break;
        }
        ++iterations;

        const auto [id, candidate] = work.front();
        work.pop();
        int& current = recorded[id];
        if (candidate <= current) continue;
        current = candidate;
        for (const auto& next : graph.successors_of(id))
            work.push({ next, std::min(candidate + 1, max_rank) });
    }

    for (const auto& id : graph.nodes) {
        const int r = recorded[id];
        ranks[id] = r < 0 ? 0 : r;
    }
    return ranks;
}

} // namespace bpmn_layout
