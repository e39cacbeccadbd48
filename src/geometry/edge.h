#pragma once

#include "common.h"
#include "error.h"

#include <cstddef>
#include <functional>
#include <string>

namespace rings {

/// An undirected edge between two distinct nodes, stored canonically
/// with a < b so that {u, v} and {v, u} compare and hash identically.
struct Edge {
    NodeId a = 0;
    NodeId b = 0;

    Edge() = default;

    /// Throws ConfigurationError for a self-loop.
    Edge(NodeId u, NodeId v) : a{u < v ? u : v}, b{u < v ? v : u} {
        if (u == v) {
            throw ConfigurationError(
                "self-loop on node " + std::to_string(u)
                + " is not a valid edge");
        }
    }

    bool has(NodeId n) const noexcept { return a == n || b == n; }

    /// The endpoint that is not `n`.  Precondition: has(n).
    NodeId other(NodeId n) const noexcept { return n == a ? b : a; }

    friend bool operator==(const Edge& l, const Edge& r) {
        return l.a == r.a && l.b == r.b;
    }
    friend bool operator!=(const Edge& l, const Edge& r) { return !(l == r); }
    friend bool operator<(const Edge& l, const Edge& r) {
        return l.a != r.a ? l.a < r.a : l.b < r.b;
    }
};

struct EdgeHash {
    std::size_t operator()(const Edge& e) const noexcept {
        std::size_t h = std::hash<NodeId>{}(e.a);
        h ^= std::hash<NodeId>{}(e.b) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace rings
