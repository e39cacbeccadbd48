#pragma once

/// Straight-line planar embedding with angular edge orbits.
///
/// Each undirected edge stores its two endpoints and four link
/// pointers: the next edge clockwise and counter-clockwise around each
/// endpoint.  Orbits are ordered by the polar angle (atan2) of the edge
/// direction as seen from that endpoint, so walking CCW around a vertex
/// visits its neighbours in increasing angle.
///
/// This is NOT a half-edge data structure: each undirected edge is a
/// single record, and a directed edge is (edge index, destination).

#include "common.h"
#include "geometry/vec2.h"

#include <cassert>
#include <cstddef>
#include <utility>
#include <vector>

namespace rings {

/// A pair of vertex indices into an embedding.
using VertexPair = std::pair<std::size_t, std::size_t>;

/// An undirected edge in the embedding.
/// `endpoint[s]` is the vertex on side `s` (s ∈ {0,1}).
/// `cw[s]` / `ccw[s]` are the next edges clockwise / counter-clockwise
/// around `endpoint[s]`.
struct EmbeddedEdge {
    std::size_t endpoint[2] = {NONE, NONE};
    std::size_t cw[2]       = {NONE, NONE}; ///< Edge indices.
    std::size_t ccw[2]      = {NONE, NONE}; ///< Edge indices.

    /// Return the side (0 or 1) that vertex `v` is on.
    /// Precondition: v == endpoint[0] or v == endpoint[1].
    int side_of(std::size_t v) const {
        if (endpoint[0] == v) return 0;
        assert(endpoint[1] == v);
        return 1;
    }

    /// Return the other endpoint.
    std::size_t other(std::size_t v) const {
        return endpoint[1 - side_of(v)];
    }
};

/// A vertex of the embedding: a position plus one incident edge.
struct EmbeddedVertex {
    Vec2        position;
    std::size_t some_edge = NONE; ///< Index of any incident edge.
};

class PlanarEmbedding {
public:
    PlanarEmbedding() = default;

    /// Embed `edges` over vertices at `positions`.  Throws GeometryError
    /// for a zero-length edge or two edges leaving a vertex in the same
    /// direction (the drawing would not be planar).
    PlanarEmbedding(std::vector<Vec2> positions,
                    const std::vector<VertexPair>& edges);

    // ── Sizes ───────────────────────────────────────────────────

    std::size_t num_vertices() const { return vertices_.size(); }
    std::size_t num_edges()    const { return edges_.size(); }

    // ── Element access ──────────────────────────────────────────

    const EmbeddedVertex& vertex(std::size_t i) const { return vertices_[i]; }
    const EmbeddedEdge&   edge(std::size_t i)   const { return edges_[i]; }

    const Vec2& position(std::size_t v) const { return vertices_[v].position; }

    // ── Construction helpers ────────────────────────────────────

    /// Add a vertex at `p`.  Returns vertex index.
    std::size_t add_vertex(const Vec2& p);

    /// Add an undirected edge between u and v, splicing it into the
    /// angular orbits at both endpoints.  Returns edge index.
    std::size_t add_edge(std::size_t u, std::size_t v);

    // ── Traversal helpers ───────────────────────────────────────

    /// Next edge CW around vertex v, starting from edge e.
    std::size_t next_cw(std::size_t e, std::size_t v) const {
        return edges_[e].cw[edges_[e].side_of(v)];
    }

    /// Next edge CCW around vertex v, starting from edge e.
    std::size_t next_ccw(std::size_t e, std::size_t v) const {
        return edges_[e].ccw[edges_[e].side_of(v)];
    }

    /// Direction angle of edge `e` leaving vertex `v`, in (−π, π].
    double edge_angle(std::size_t e, std::size_t v) const;

    /// Iterate over all edges incident to vertex v in CCW (increasing
    /// angle) order, calling f(edge_index) for each.
    template <typename F>
    void for_each_edge_ccw(std::size_t v, F&& f) const {
        std::size_t start = vertices_[v].some_edge;
        if (start == NONE) return;
        std::size_t e = start;
        do {
            f(e);
            e = next_ccw(e, v);
        } while (e != start);
    }

    std::size_t degree(std::size_t v) const;

    /// Face traversal: given a directed edge (arriving at `dest` via
    /// edge `edge_idx`), return the next directed edge around the face.
    /// Taking the CW-next edge at `dest` keeps the face on the left, so
    /// bounded faces are walked anticlockwise and the unbounded face of
    /// each component clockwise.
    struct DirEdge {
        std::size_t edge_idx;
        std::size_t dest; ///< The vertex we're heading towards.
    };
    DirEdge face_next(std::size_t edge_idx, std::size_t dest) const;

private:
    std::vector<EmbeddedVertex> vertices_;
    std::vector<EmbeddedEdge>   edges_;

    /// Insert edge `e` into the angular orbit of vertex `v`.
    void splice_into_orbit(std::size_t e, std::size_t v);
};

} // namespace rings
