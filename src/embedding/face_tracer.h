#pragma once

/// Angular face tracing over a PlanarEmbedding.
///
/// Every directed edge borders exactly one face.  Starting from each
/// unused directed edge we repeatedly take face_next() until we return
/// to the start; the visited cycle is one face, kept on the left of
/// every step.  Bounded faces come out anticlockwise (positive signed
/// area), the unbounded face of each connected component clockwise
/// (negative signed area).

#include "embedding/planar_embedding.h"

#include <cstddef>
#include <vector>

namespace rings {

/// One closed face boundary, in traversal order.
struct TracedFace {
    /// vertices[i] is the tail of edges[i]; the face closes from
    /// vertices.back() back to vertices.front().
    std::vector<std::size_t> vertices;
    std::vector<std::size_t> edges;
    double signed_area = 0.0;

    std::size_t size() const noexcept { return edges.size(); }

    /// True for an anticlockwise (interior) face.
    bool is_bounded() const noexcept { return signed_area > 0.0; }
};

/// Trace every face of the embedding.  The face sizes sum to twice the
/// edge count.  Faces are emitted in order of their first directed edge.
std::vector<TracedFace> trace_faces(const PlanarEmbedding& embedding);

/// Edges of `face` that separate it from a different face.  An edge
/// walked in both directions by the same face (a bridge or a dangling
/// chain reaching into it) does not bound the face and is dropped.
/// Result is sorted by edge index.
std::vector<std::size_t> boundary_edges(const TracedFace& face);

/// Remove vertices of degree 1, repeatedly, so that whole dangling
/// chains disappear.  A dangling node can never lie on a ring.
/// Returns the surviving edges in their original relative order.
std::vector<VertexPair> prune_dangling(std::size_t num_vertices,
                                       const std::vector<VertexPair>& edges);

} // namespace rings
