#include "finder/ring_finder.h"

#include "embedding/face_tracer.h"
#include "embedding/planar_embedding.h"
#include "error.h"

#include <cstdio>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rings {

RingFinder::RingFinder(const Graph& graph,
                       std::shared_ptr<const CoordMap> coords,
                       RingFinderOptions options)
    : options_{options}
{
    check_coordinates(graph, coords.get());

    // ── Dense vertex indices for every node that has an edge ────────
    std::vector<NodeId> node_of;
    std::unordered_map<NodeId, std::size_t> index_of;
    std::vector<Vec2> positions;
    for (NodeId n : graph.nodes()) {
        if (graph.degree(n) == 0) continue;
        index_of.emplace(n, node_of.size());
        node_of.push_back(n);
        positions.push_back(coords->at(n));
    }

    std::vector<VertexPair> edges;
    edges.reserve(graph.num_edges());
    for (const auto& e : graph.edges()) {
        edges.emplace_back(index_of.at(e.a), index_of.at(e.b));
    }

    const auto kept = prune_dangling(node_of.size(), edges);
    PlanarEmbedding embedding(std::move(positions), kept);
    const auto faces = trace_faces(embedding);

    // ── Classify: anticlockwise faces are interior rings ────────────
    std::size_t outer_faces = 0;
    for (const auto& face : faces) {
        if (!face.is_bounded()) {
            ++outer_faces;
            continue;
        }
        std::vector<Edge> ring_edges;
        for (std::size_t ei : boundary_edges(face)) {
            const auto& ee = embedding.edge(ei);
            ring_edges.emplace_back(node_of[ee.endpoint[0]],
                                    node_of[ee.endpoint[1]]);
        }
        current_rings_.emplace(std::move(ring_edges), coords);
    }

    perimeter_rings_ = find_perimeters(current_rings_);

    if (options_.verbose) {
        std::fprintf(stderr,
                     "ring_finder: %zu nodes, %zu edges (%zu after pruning), "
                     "%zu faces (%zu outer)\n",
                     node_of.size(), edges.size(), kept.size(),
                     faces.size(), outer_faces);
        std::fprintf(stderr, "ring_finder: %zu rings, %zu perimeter loops\n",
                     current_rings_.size(), perimeter_rings_.size());
    }
}

std::map<std::size_t, std::size_t> RingFinder::ring_size_histogram() const {
    std::map<std::size_t, std::size_t> histogram;
    for (const auto& ring : current_rings_) ++histogram[ring.size()];
    return histogram;
}

void RingFinder::check_coordinates(const Graph& graph, const CoordMap* coords) {
    if (coords == nullptr) {
        throw ConfigurationError("ring finding needs a coordinate map");
    }
    for (NodeId n : graph.nodes()) {
        if (graph.degree(n) > 0 && coords->find(n) == coords->end()) {
            throw ConfigurationError("node " + std::to_string(n)
                                     + " has no coordinate");
        }
    }
}

ShapeSet RingFinder::find_perimeters(const ShapeSet& rings) {
    std::vector<const Shape*> ring_list;
    ring_list.reserve(rings.size());
    for (const auto& ring : rings) ring_list.push_back(&ring);

    std::unordered_map<Edge, std::vector<std::size_t>, EdgeHash> owners;
    for (std::size_t i = 0; i < ring_list.size(); ++i) {
        for (const auto& e : ring_list[i]->edges()) owners[e].push_back(i);
    }

    ShapeSet perimeters;
    std::vector<bool> visited(ring_list.size(), false);
    for (std::size_t root = 0; root < ring_list.size(); ++root) {
        if (visited[root]) continue;

        // ── Merge one shared-edge component ─────────────────────────
        Shape merged = *ring_list[root];
        visited[root] = true;
        std::vector<std::size_t> stack{root};
        while (!stack.empty()) {
            const std::size_t r = stack.back();
            stack.pop_back();
            for (const auto& e : ring_list[r]->edges()) {
                for (std::size_t nb : owners[e]) {
                    if (visited[nb]) continue;
                    visited[nb] = true;
                    merged = merged.merge(*ring_list[nb]);
                    stack.push_back(nb);
                }
            }
        }
        if (merged.empty()) continue;

        // ── Split the surviving edges into connected loops ──────────
        const auto& left = merged.edges();
        std::unordered_map<NodeId, std::vector<std::size_t>> at_node;
        for (std::size_t i = 0; i < left.size(); ++i) {
            at_node[left[i].a].push_back(i);
            at_node[left[i].b].push_back(i);
        }
        std::vector<bool> taken(left.size(), false);
        for (std::size_t seed = 0; seed < left.size(); ++seed) {
            if (taken[seed]) continue;
            std::vector<Edge> loop;
            std::vector<std::size_t> todo{seed};
            taken[seed] = true;
            while (!todo.empty()) {
                const Edge e = left[todo.back()];
                todo.pop_back();
                loop.push_back(e);
                for (NodeId n : {e.a, e.b}) {
                    for (std::size_t j : at_node[n]) {
                        if (!taken[j]) {
                            taken[j] = true;
                            todo.push_back(j);
                        }
                    }
                }
            }
            perimeters.emplace(std::move(loop), merged.coordinates());
        }
    }
    return perimeters;
}

} // namespace rings
