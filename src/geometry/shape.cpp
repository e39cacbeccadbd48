#include "geometry/shape.h"

#include "error.h"

#include <algorithm>
#include <iterator>
#include <ostream>
#include <sstream>

namespace rings {

namespace {

const Vec2& lookup(const CoordMap& coords, NodeId n) {
    auto it = coords.find(n);
    if (it == coords.end()) {
        throw GeometryError("no coordinate for node " + std::to_string(n));
    }
    return it->second;
}

} // namespace

// ── Construction ────────────────────────────────────────────────────

Shape::Shape(std::vector<Edge> edges, std::shared_ptr<const CoordMap> coords)
    : edges_{std::move(edges)}, coords_{std::move(coords)}
{
    std::sort(edges_.begin(), edges_.end());
    edges_.erase(std::unique(edges_.begin(), edges_.end()), edges_.end());
}

std::vector<NodeId> Shape::nodes() const {
    std::vector<NodeId> out;
    out.reserve(edges_.size() * 2);
    for (const auto& e : edges_) {
        out.push_back(e.a);
        out.push_back(e.b);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

bool Shape::contains(const Edge& e) const {
    return std::binary_search(edges_.begin(), edges_.end(), e);
}

// ── Merge ───────────────────────────────────────────────────────────

Shape Shape::merge(const Shape& other) const {
    if (coords_ && other.coords_ && coords_ != other.coords_) {
        std::vector<NodeId> mine = nodes();
        std::vector<NodeId> theirs = other.nodes();
        std::vector<NodeId> common;
        std::set_intersection(mine.begin(), mine.end(),
                              theirs.begin(), theirs.end(),
                              std::back_inserter(common));
        for (NodeId n : common) {
            if (lookup(*coords_, n) != lookup(*other.coords_, n)) {
                throw GeometryError(
                    "these two shapes believe that node " + std::to_string(n)
                    + " is in two different places");
            }
        }
    }

    std::vector<Edge> unique_edges;
    std::set_symmetric_difference(edges_.begin(), edges_.end(),
                                  other.edges_.begin(), other.edges_.end(),
                                  std::back_inserter(unique_edges));
    return Shape(std::move(unique_edges), coords_);
}

// ── Ordering ────────────────────────────────────────────────────────

bool Shape::walk_ring(std::vector<NodeId>& node_list) const {
    node_list.clear();
    if (edges_.empty()) return true;

    std::unordered_map<NodeId, std::vector<NodeId>> adjacency;
    for (const auto& e : edges_) {
        adjacency[e.a].push_back(e.b);
        adjacency[e.b].push_back(e.a);
    }
    if (adjacency.size() != edges_.size()) return false;
    for (const auto& [node, neighbours] : adjacency) {
        if (neighbours.size() != 2) return false;
    }

    // edges_ is sorted, so the smallest node is the first edge's a.
    node_list.reserve(edges_.size());
    node_list.push_back(edges_.front().a);
    std::unordered_set<NodeId> seen{node_list.front()};

    while (node_list.size() < edges_.size()) {
        // Pick the smallest unvisited neighbour; winding is fixed later.
        NodeId next = NONE;
        for (NodeId n : adjacency[node_list.back()]) {
            if (!seen.count(n) && (next == NONE || n < next)) next = n;
        }
        if (next == NONE) return false;
        node_list.push_back(next);
        seen.insert(next);
    }
    return true;
}

bool Shape::is_simple_ring() const {
    std::vector<NodeId> node_list;
    return walk_ring(node_list);
}

std::vector<NodeId> Shape::to_node_list() const {
    std::vector<NodeId> node_list;
    if (!walk_ring(node_list)) {
        throw GeometryError("shape " + to_string() + " with "
                            + std::to_string(edges_.size())
                            + " edges is not a simple ring");
    }

    wind_anticlockwise(node_list);
    return node_list;
}

void Shape::wind_anticlockwise(std::vector<NodeId>& node_list) const {
    if (coords_ && polygon_signed_area(node_list, *coords_) < 0.0) {
        // Reverse, then rotate so the minimum node leads again.
        std::reverse(node_list.begin(), node_list.end());
        std::rotate(node_list.begin(), node_list.end() - 1, node_list.end());
    }
}

// ── Geometry ────────────────────────────────────────────────────────

const CoordMap& Shape::require_coordinates(const char* what) const {
    if (!coords_) {
        throw GeometryError(std::string("shape has no coordinates, cannot ")
                            + what);
    }
    return *coords_;
}

double Shape::area() const {
    const CoordMap& coords = require_coordinates("compute its area");
    return polygon_signed_area(to_node_list(), coords);
}

std::vector<Vec2> Shape::to_polygon() const {
    const CoordMap& coords = require_coordinates("construct a polygon");
    std::vector<Vec2> polygon;
    for (NodeId n : to_node_list()) {
        polygon.push_back(lookup(coords, n));
    }
    return polygon;
}

std::string Shape::to_string() const {
    std::ostringstream os;
    os << '[';
    std::vector<NodeId> node_list;
    if (walk_ring(node_list)) {
        wind_anticlockwise(node_list);
        for (std::size_t i = 0; i < node_list.size(); ++i) {
            if (i) os << ", ";
            os << node_list[i];
        }
    } else {
        for (std::size_t i = 0; i < edges_.size(); ++i) {
            if (i) os << ", ";
            os << '{' << edges_[i].a << ", " << edges_[i].b << '}';
        }
    }
    os << ']';
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Shape& shape) {
    return os << shape.to_string();
}

std::size_t ShapeHash::operator()(const Shape& s) const noexcept {
    EdgeHash eh;
    std::size_t h = s.size();
    for (const auto& e : s.edges()) {
        h ^= eh(e) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return h;
}

// ── Free functions ──────────────────────────────────────────────────

double polygon_signed_area(const std::vector<NodeId>& node_list,
                           const CoordMap& coords) {
    double signed_area = 0.0;
    const std::size_t n = node_list.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Vec2& here = lookup(coords, node_list[i]);
        const Vec2& next = lookup(coords, node_list[(i + 1) % n]);
        signed_area += cross(here, next);
    }
    return 0.5 * signed_area;
}

std::vector<Edge> node_list_to_edges(const std::vector<NodeId>& node_list,
                                     bool is_ring) {
    std::vector<Edge> edges;
    const std::size_t n = node_list.size();
    if (n < 2) return edges;
    const std::size_t count = is_ring ? n : n - 1;
    edges.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        edges.emplace_back(node_list[i], node_list[(i + 1) % n]);
    }
    return edges;
}

} // namespace rings
