#pragma once

/// Edge-set polygon used to store, compare and combine rings.
///
/// A Shape is defined solely by its set of undirected edges: two shapes
/// with the same edges are equal (and hash equal) regardless of the
/// order in which the ring was traversed.  Coordinates are optional and
/// shared by reference; a shape without them is "abstract" and refuses
/// any geometric query.

#include "common.h"
#include "geometry/edge.h"
#include "geometry/vec2.h"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rings {

using CoordMap = std::unordered_map<NodeId, Vec2>;

class Shape {
public:
    Shape() = default;

    /// Build from an edge collection.  Repeated edges collapse (set
    /// semantics).  `coords` may be null for an abstract shape.
    explicit Shape(std::vector<Edge> edges,
                   std::shared_ptr<const CoordMap> coords = nullptr);

    // ── Content ─────────────────────────────────────────────────

    /// Canonical sorted, unique edge list.
    const std::vector<Edge>& edges() const noexcept { return edges_; }

    /// Sorted, unique list of every node touched by an edge.
    std::vector<NodeId> nodes() const;

    /// Number of edges (the ring size, for a simple ring).
    std::size_t size() const noexcept { return edges_.size(); }
    bool empty() const noexcept { return edges_.empty(); }

    bool contains(const Edge& e) const;

    bool has_coordinates() const noexcept { return coords_ != nullptr; }
    const std::shared_ptr<const CoordMap>& coordinates() const noexcept {
        return coords_;
    }

    // ── Combination ─────────────────────────────────────────────

    /// Symmetric difference of the two edge sets: shared edges cancel.
    /// Two adjacent squares merge into a hexagon.  When both shapes
    /// carry coordinates, every common node must sit at exactly the same
    /// position in both, else GeometryError.  The result keeps this
    /// shape's coordinates.
    Shape merge(const Shape& other) const;

    // ── Ordering and geometry ───────────────────────────────────

    /// Turn the edge set into a connected node cycle starting at the
    /// minimum node and stepping to the smallest unvisited neighbour.
    /// With coordinates, the cycle is then re-wound anticlockwise
    /// (still starting at the minimum node).  Throws GeometryError if
    /// the shape is not a single simple ring.
    std::vector<NodeId> to_node_list() const;

    /// True if to_node_list() would succeed.
    bool is_simple_ring() const;

    /// Shoelace area of the canonically ordered ring.  Never negative.
    double area() const;

    /// Ordered vertex coordinates of the closed polygon (the closing
    /// edge from the last point back to the first is implicit).
    std::vector<Vec2> to_polygon() const;

    /// "[0, 1, 2]"-style rendering of to_node_list(); falls back to the
    /// edge list for shapes that are not simple rings.
    std::string to_string() const;

    friend bool operator==(const Shape& l, const Shape& r) {
        return l.edges_ == r.edges_;
    }
    friend bool operator!=(const Shape& l, const Shape& r) { return !(l == r); }

private:
    std::vector<Edge> edges_;
    std::shared_ptr<const CoordMap> coords_;

    const CoordMap& require_coordinates(const char* what) const;

    /// Unwound min-first walk; false if the edges are not one simple ring.
    bool walk_ring(std::vector<NodeId>& node_list) const;
    void wind_anticlockwise(std::vector<NodeId>& node_list) const;
};

std::ostream& operator<<(std::ostream& os, const Shape& shape);

struct ShapeHash {
    std::size_t operator()(const Shape& s) const noexcept;
};

using ShapeSet = std::unordered_set<Shape, ShapeHash>;

/// Signed shoelace area of an ordered node cycle: positive when the
/// nodes run anticlockwise, negative when clockwise.
/// Throws GeometryError if a node has no coordinate.
double polygon_signed_area(const std::vector<NodeId>& node_list,
                           const CoordMap& coords);

/// Inverse of Shape::to_node_list.  node_list[i] is joined to
/// node_list[i + 1]; with `is_ring` the last node is also joined back
/// to the first.
std::vector<Edge> node_list_to_edges(const std::vector<NodeId>& node_list,
                                     bool is_ring = true);

} // namespace rings
