#pragma once

/// Undirected input graph: node handles and their neighbour lists.
///
/// This is the only graph capability the ring finders need.  Nodes are
/// kept in ascending id order so that every traversal built on top of
/// the graph is deterministic.

#include "common.h"
#include "geometry/edge.h"

#include <cstddef>
#include <map>
#include <vector>

namespace rings {

class Graph {
public:
    Graph() = default;

    /// Build from an edge list; equivalent to add_edge for each pair.
    explicit Graph(const std::vector<Edge>& edges);

    // ── Construction ────────────────────────────────────────────

    /// Add an isolated node.  No-op if it already exists.
    void add_node(NodeId n);

    /// Add an undirected edge, creating either node as needed.
    /// Repeated edges are ignored; a self-loop throws ConfigurationError.
    void add_edge(NodeId u, NodeId v);

    // ── Queries ─────────────────────────────────────────────────

    std::size_t num_nodes() const noexcept { return adjacency_.size(); }
    std::size_t num_edges() const noexcept { return num_edges_; }

    bool has_node(NodeId n) const { return adjacency_.count(n) != 0; }
    bool has_edge(NodeId u, NodeId v) const;

    /// All nodes in ascending order.
    std::vector<NodeId> nodes() const;

    /// Neighbours of `n` in insertion order.  Empty for unknown nodes.
    const std::vector<NodeId>& neighbors(NodeId n) const;

    std::size_t degree(NodeId n) const { return neighbors(n).size(); }

    /// Every edge once, in canonical (a < b) sorted order.
    std::vector<Edge> edges() const;

private:
    std::map<NodeId, std::vector<NodeId>> adjacency_;
    std::size_t num_edges_ = 0;
};

} // namespace rings
