#include "finder/periodic_ring_finder.h"

#include "embedding/face_tracer.h"
#include "embedding/planar_embedding.h"
#include "error.h"
#include "finder/periodic_wrap.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <set>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace rings {

namespace {

Vec2 image_shift(ImageOffset o, const Vec2& cell) {
    return {o.x * cell.x, o.y * cell.y};
}

/// Fold x into [0, length).
double fold(double x, double length) {
    double r = x - length * std::floor(x / length);
    return r >= length ? 0.0 : r;
}

/// Tiled-graph vertex numbering: node-major, then image offset.
class ImageIndex {
public:
    ImageIndex(std::size_t num_nodes, int radius)
        : num_nodes_{num_nodes}, radius_{radius}, side_{2 * radius + 1} {}

    std::size_t size() const {
        return num_nodes_ * static_cast<std::size_t>(side_ * side_);
    }

    bool in_range(ImageOffset o) const {
        return std::abs(o.x) <= radius_ && std::abs(o.y) <= radius_;
    }

    std::size_t index(std::size_t node, ImageOffset o) const {
        return node * static_cast<std::size_t>(side_ * side_)
             + static_cast<std::size_t>((o.x + radius_) * side_ + (o.y + radius_));
    }

    std::size_t node(std::size_t idx) const {
        return idx / static_cast<std::size_t>(side_ * side_);
    }

    ImageOffset offset(std::size_t idx) const {
        const int cell = static_cast<int>(idx % static_cast<std::size_t>(side_ * side_));
        return {cell / side_ - radius_, cell % side_ - radius_};
    }

    int radius() const { return radius_; }

private:
    std::size_t num_nodes_;
    int radius_;
    int side_;
};

using RingKey = std::vector<std::tuple<NodeId, int, int>>;

} // namespace

PeriodicRingFinder::PeriodicRingFinder(const Graph& graph,
                                       std::shared_ptr<const CoordMap> coords,
                                       Vec2 cell,
                                       RingFinderOptions options)
    : RingFinder(options), cell_{cell}
{
    if (!(std::isfinite(cell.x) && std::isfinite(cell.y)
          && cell.x > 0.0 && cell.y > 0.0)) {
        throw ConfigurationError("periodic cell must have positive finite "
                                 "dimensions, got (" + std::to_string(cell.x)
                                 + ", " + std::to_string(cell.y) + ")");
    }
    if (options_.image_radius < 1) {
        throw ConfigurationError("image radius must be at least 1, got "
                                 + std::to_string(options_.image_radius));
    }
    check_coordinates(graph, coords.get());

    // ── Base nodes, folded into the unit cell ───────────────────────
    std::vector<NodeId> node_of;
    std::unordered_map<NodeId, std::size_t> index_of;
    std::vector<Vec2> base;
    for (NodeId n : graph.nodes()) {
        if (graph.degree(n) == 0) continue;
        index_of.emplace(n, node_of.size());
        node_of.push_back(n);
        const Vec2& p = coords->at(n);
        base.push_back({fold(p.x, cell.x), fold(p.y, cell.y)});
    }

    // ── Wrap vectors by the minimum-image convention ────────────────
    const auto graph_edges = graph.edges();
    WrapMap wrap;
    std::size_t wrapped_edges = 0;
    for (const auto& e : graph_edges) {
        const Vec2 d = base[index_of.at(e.b)] - base[index_of.at(e.a)];
        const ImageOffset w = minimum_image_wrap(d, cell);
        if (w != ImageOffset{}) ++wrapped_edges;
        wrap.emplace(e, w);
    }

    // ── Tile the graph over the image block ─────────────────────────
    const ImageIndex images(node_of.size(), options_.image_radius);
    const int r = images.radius();

    std::vector<Vec2> positions(images.size());
    for (std::size_t i = 0; i < node_of.size(); ++i) {
        for (int ox = -r; ox <= r; ++ox) {
            for (int oy = -r; oy <= r; ++oy) {
                const ImageOffset o{ox, oy};
                positions[images.index(i, o)] = base[i] + image_shift(o, cell);
            }
        }
    }

    std::vector<VertexPair> tiled_edges;
    tiled_edges.reserve(graph_edges.size() * static_cast<std::size_t>((2 * r + 1) * (2 * r + 1)));
    for (const auto& e : graph_edges) {
        const std::size_t ia = index_of.at(e.a);
        const std::size_t ib = index_of.at(e.b);
        const ImageOffset w = wrap.at(e);
        for (int ox = -r; ox <= r; ++ox) {
            for (int oy = -r; oy <= r; ++oy) {
                const ImageOffset o{ox, oy};
                if (!images.in_range(o + w)) continue;
                tiled_edges.emplace_back(images.index(ia, o),
                                         images.index(ib, o + w));
            }
        }
    }

    const auto kept = prune_dangling(images.size(), tiled_edges);
    PlanarEmbedding embedding(std::move(positions), kept);
    const auto faces = trace_faces(embedding);

    // ── Canonicalise and deduplicate the bounded faces ──────────────
    std::set<RingKey> seen;
    std::size_t bounded = 0;
    for (const auto& face : faces) {
        if (!face.is_bounded()) continue;
        ++bounded;

        const auto ring_edges = boundary_edges(face);
        std::vector<std::size_t> ring_vertices;
        for (std::size_t ei : ring_edges) {
            ring_vertices.push_back(embedding.edge(ei).endpoint[0]);
            ring_vertices.push_back(embedding.edge(ei).endpoint[1]);
        }
        std::sort(ring_vertices.begin(), ring_vertices.end());
        ring_vertices.erase(std::unique(ring_vertices.begin(), ring_vertices.end()),
                            ring_vertices.end());

        // Sort images by caller node id; the smallest sets the origin.
        std::vector<std::pair<NodeId, ImageOffset>> members;
        for (std::size_t v : ring_vertices) {
            members.emplace_back(node_of[images.node(v)], images.offset(v));
        }
        std::sort(members.begin(), members.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        for (std::size_t i = 1; i < members.size(); ++i) {
            if (members[i].first == members[i - 1].first) {
                throw GeometryError("ring visits node "
                                    + std::to_string(members[i].first)
                                    + " through two periodic images; the cell is "
                                      "too small to describe it by node ids");
            }
        }

        const ImageOffset origin = members.front().second;
        RingKey key;
        key.reserve(members.size());
        for (const auto& [node, o] : members) {
            const ImageOffset rel = o - origin;
            key.emplace_back(node, rel.x, rel.y);
        }
        if (!seen.insert(std::move(key)).second) continue;

        auto ring_coords = std::make_shared<CoordMap>();
        for (std::size_t v : ring_vertices) {
            const ImageOffset rel = images.offset(v) - origin;
            (*ring_coords)[node_of[images.node(v)]] =
                base[images.node(v)] + image_shift(rel, cell);
        }
        std::vector<Edge> shape_edges;
        shape_edges.reserve(ring_edges.size());
        for (std::size_t ei : ring_edges) {
            const auto& ee = embedding.edge(ei);
            shape_edges.emplace_back(node_of[images.node(ee.endpoint[0])],
                                     node_of[images.node(ee.endpoint[1])]);
        }
        Shape ring(std::move(shape_edges), std::move(ring_coords));
        // The node-id projection of a tiled face must still close
        // without winding around the cell.
        if (ring.is_simple_ring()) check_wrap_sum(ring.to_node_list(), wrap);
        current_rings_.insert(std::move(ring));
    }

    // Each ring has its own placement, so merge abstract copies.
    ShapeSet abstract_rings;
    for (const auto& ring : current_rings_) abstract_rings.emplace(ring.edges());
    perimeter_rings_ = find_perimeters(abstract_rings);

    if (options_.verbose) {
        std::fprintf(stderr,
                     "periodic_ring_finder: %zu nodes, %zu edges (%zu wrapped), "
                     "cell (%g, %g), radius %d\n",
                     node_of.size(), graph_edges.size(), wrapped_edges,
                     cell.x, cell.y, r);
        std::fprintf(stderr,
                     "periodic_ring_finder: %zu tiled edges (%zu after pruning), "
                     "%zu faces, %zu bounded\n",
                     tiled_edges.size(), kept.size(), faces.size(), bounded);
        std::fprintf(stderr,
                     "periodic_ring_finder: %zu rings (%zu image copies dropped), "
                     "%zu perimeter loops\n",
                     current_rings_.size(), bounded - seen.size(),
                     perimeter_rings_.size());
    }
}

} // namespace rings
