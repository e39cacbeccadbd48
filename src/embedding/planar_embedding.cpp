#include "embedding/planar_embedding.h"

#include "error.h"

#include <string>

namespace rings {

PlanarEmbedding::PlanarEmbedding(std::vector<Vec2> positions,
                                 const std::vector<VertexPair>& edges) {
    vertices_.reserve(positions.size());
    for (const auto& p : positions) add_vertex(p);
    edges_.reserve(edges.size());
    for (const auto& [u, v] : edges) add_edge(u, v);
}

std::size_t PlanarEmbedding::add_vertex(const Vec2& p) {
    std::size_t idx = vertices_.size();
    vertices_.push_back(EmbeddedVertex{.position = p});
    return idx;
}

std::size_t PlanarEmbedding::add_edge(std::size_t u, std::size_t v) {
    assert(u < vertices_.size() && v < vertices_.size());
    const Vec2 d = vertices_[v].position - vertices_[u].position;
    if (u == v || (d.x == 0.0 && d.y == 0.0)) {
        throw GeometryError("edge " + std::to_string(u) + "-"
                            + std::to_string(v) + " has zero length");
    }

    std::size_t idx = edges_.size();
    edges_.push_back(EmbeddedEdge{});
    auto& e = edges_[idx];
    e.endpoint[0] = u;
    e.endpoint[1] = v;

    splice_into_orbit(idx, u);
    splice_into_orbit(idx, v);

    return idx;
}

double PlanarEmbedding::edge_angle(std::size_t e, std::size_t v) const {
    const std::size_t w = edges_[e].other(v);
    return angle_of(vertices_[w].position - vertices_[v].position);
}

std::size_t PlanarEmbedding::degree(std::size_t v) const {
    std::size_t d = 0;
    for_each_edge_ccw(v, [&](std::size_t) { ++d; });
    return d;
}

void PlanarEmbedding::splice_into_orbit(std::size_t e, std::size_t v) {
    auto& vert = vertices_[v];
    int s = edges_[e].side_of(v);

    if (vert.some_edge == NONE) {
        // First edge at this vertex: point to self.
        vert.some_edge = e;
        edges_[e].cw[s]  = e;
        edges_[e].ccw[s] = e;
        return;
    }

    // Find the CCW predecessor: the edge with the largest angle below
    // theta, or (if theta is the smallest) the largest angle overall.
    const double theta = edge_angle(e, v);
    std::size_t below = NONE, top = NONE;
    double below_angle = 0.0, top_angle = 0.0;
    std::size_t cur = vert.some_edge;
    do {
        const double a = edge_angle(cur, v);
        if (a == theta) {
            throw GeometryError(
                "edges " + std::to_string(edges_[cur].other(v)) + " and "
                + std::to_string(edges_[e].other(v)) + " leave vertex "
                + std::to_string(v) + " in the same direction");
        }
        if (a < theta && (below == NONE || a > below_angle)) {
            below = cur;
            below_angle = a;
        }
        if (top == NONE || a > top_angle) {
            top = cur;
            top_angle = a;
        }
        cur = next_ccw(cur, v);
    } while (cur != vert.some_edge);

    const std::size_t after = below != NONE ? below : top;

    // Link: after → e → next  (CCW order around v).
    int as = edges_[after].side_of(v);
    std::size_t next = edges_[after].ccw[as];

    edges_[after].ccw[as] = e;
    edges_[e].cw[s]       = after;
    edges_[e].ccw[s]      = next;

    int ns = edges_[next].side_of(v);
    edges_[next].cw[ns] = e;
}

PlanarEmbedding::DirEdge
PlanarEmbedding::face_next(std::size_t edge_idx, std::size_t dest) const {
    // We arrived at `dest` via `edge_idx`.  The next edge around the
    // face is the CW-next one at `dest` (the largest angle below the
    // edge we came in on), and we travel along it away from `dest`.
    int s = edges_[edge_idx].side_of(dest);
    std::size_t nxt = edges_[edge_idx].cw[s];
    return {nxt, edges_[nxt].other(dest)};
}

} // namespace rings
