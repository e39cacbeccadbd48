#include "embedding/face_tracer.h"

#include <algorithm>
#include <cassert>

namespace rings {

namespace {

/// Directed edge id: edge `e` leaving endpoint[side].
std::size_t dir_id(std::size_t e, int side) { return 2 * e + side; }

} // namespace

std::vector<TracedFace> trace_faces(const PlanarEmbedding& embedding) {
    const std::size_t ne = embedding.num_edges();
    std::vector<bool> used(2 * ne, false);
    std::vector<TracedFace> faces;

    for (std::size_t e0 = 0; e0 < ne; ++e0) {
        for (int s0 = 0; s0 < 2; ++s0) {
            if (used[dir_id(e0, s0)]) continue;

            TracedFace face;
            const std::size_t start = embedding.edge(e0).endpoint[s0];
            std::size_t e    = e0;
            std::size_t from = start;
            std::size_t guard = 2 * ne + 1;
            do {
                const auto& edge = embedding.edge(e);
                assert(!used[dir_id(e, edge.side_of(from))]);
                used[dir_id(e, edge.side_of(from))] = true;
                face.vertices.push_back(from);
                face.edges.push_back(e);

                const std::size_t dest = edge.other(from);
                const auto next = embedding.face_next(e, dest);
                from = dest;
                e    = next.edge_idx;
                if (--guard == 0) break; // safety: avoid infinite loop
            } while (e != e0 || from != start);

            const std::size_t n = face.vertices.size();
            double twice_area = 0.0;
            for (std::size_t i = 0; i < n; ++i) {
                twice_area += cross(embedding.position(face.vertices[i]),
                                    embedding.position(face.vertices[(i + 1) % n]));
            }
            face.signed_area = 0.5 * twice_area;
            faces.push_back(std::move(face));
        }
    }
    return faces;
}

std::vector<std::size_t> boundary_edges(const TracedFace& face) {
    std::vector<std::size_t> sorted = face.edges;
    std::sort(sorted.begin(), sorted.end());

    std::vector<std::size_t> out;
    out.reserve(sorted.size());
    for (std::size_t i = 0; i < sorted.size(); ) {
        std::size_t j = i;
        while (j < sorted.size() && sorted[j] == sorted[i]) ++j;
        if (j - i == 1) out.push_back(sorted[i]);
        i = j;
    }
    return out;
}

std::vector<VertexPair> prune_dangling(std::size_t num_vertices,
                                       const std::vector<VertexPair>& edges) {
    std::vector<std::vector<std::size_t>> incident(num_vertices);
    for (std::size_t i = 0; i < edges.size(); ++i) {
        incident[edges[i].first].push_back(i);
        incident[edges[i].second].push_back(i);
    }

    std::vector<std::size_t> degree(num_vertices);
    std::vector<std::size_t> stack;
    for (std::size_t v = 0; v < num_vertices; ++v) {
        degree[v] = incident[v].size();
        if (degree[v] == 1) stack.push_back(v);
    }

    std::vector<bool> removed(edges.size(), false);
    while (!stack.empty()) {
        const std::size_t v = stack.back();
        stack.pop_back();
        if (degree[v] != 1) continue;
        for (std::size_t ei : incident[v]) {
            if (removed[ei]) continue;
            removed[ei] = true;
            --degree[v];
            const std::size_t w = edges[ei].first == v ? edges[ei].second
                                                       : edges[ei].first;
            if (--degree[w] == 1) stack.push_back(w);
            break;
        }
    }

    std::vector<VertexPair> kept;
    kept.reserve(edges.size());
    for (std::size_t i = 0; i < edges.size(); ++i) {
        if (!removed[i]) kept.push_back(edges[i]);
    }
    return kept;
}

} // namespace rings
