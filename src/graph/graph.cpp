#include "graph/graph.h"

#include <algorithm>

namespace rings {

Graph::Graph(const std::vector<Edge>& edges) {
    for (const auto& e : edges) add_edge(e.a, e.b);
}

void Graph::add_node(NodeId n) {
    adjacency_.try_emplace(n);
}

void Graph::add_edge(NodeId u, NodeId v) {
    Edge e(u, v); // rejects self-loops
    if (has_edge(e.a, e.b)) return;
    adjacency_[e.a].push_back(e.b);
    adjacency_[e.b].push_back(e.a);
    ++num_edges_;
}

bool Graph::has_edge(NodeId u, NodeId v) const {
    auto it = adjacency_.find(u);
    if (it == adjacency_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), v)
        != it->second.end();
}

std::vector<NodeId> Graph::nodes() const {
    std::vector<NodeId> out;
    out.reserve(adjacency_.size());
    for (const auto& [n, nbrs] : adjacency_) out.push_back(n);
    return out;
}

const std::vector<NodeId>& Graph::neighbors(NodeId n) const {
    static const std::vector<NodeId> empty;
    auto it = adjacency_.find(n);
    return it == adjacency_.end() ? empty : it->second;
}

std::vector<Edge> Graph::edges() const {
    std::vector<Edge> out;
    out.reserve(num_edges_);
    for (const auto& [n, nbrs] : adjacency_) {
        for (NodeId m : nbrs) {
            if (n < m) out.emplace_back(n, m);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace rings
