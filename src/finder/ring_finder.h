#pragma once

/// Minimal-ring extraction for a planar straight-line graph.
///
/// The constructor runs the whole pipeline:
///   1. validate coordinates, drop dangling chains,
///   2. embed the graph with angular edge orbits and trace every face,
///   3. keep the anticlockwise (bounded) faces as current_rings,
///   4. group current_rings that share edges and XOR-merge each group;
///      what survives is the outer boundary, split into loops as
///      perimeter_rings.
///
/// Results never change after construction.  Any error aborts the
/// constructor, so a half-built finder is never observable.

#include "finder/options.h"
#include "geometry/shape.h"
#include "graph/graph.h"

#include <cstddef>
#include <map>
#include <memory>

namespace rings {

class RingFinder {
public:
    /// Every node with at least one edge needs an entry in `coords`,
    /// else ConfigurationError.
    RingFinder(const Graph& graph,
               std::shared_ptr<const CoordMap> coords,
               RingFinderOptions options = {});

    virtual ~RingFinder() = default;

    /// Minimal interior rings, each unique by edge content.
    const ShapeSet& current_rings() const noexcept { return current_rings_; }

    /// Outer boundary loop(s) of the ring network.
    const ShapeSet& perimeter_rings() const noexcept { return perimeter_rings_; }

    /// Ring size → number of current rings of that size.
    std::map<std::size_t, std::size_t> ring_size_histogram() const;

    const RingFinderOptions& options() const noexcept { return options_; }

protected:
    explicit RingFinder(RingFinderOptions options) : options_{options} {}

    /// Group `rings` into components linked by shared edges, merge each
    /// component (shared edges cancel) and split what remains into
    /// connected loops.
    static ShapeSet find_perimeters(const ShapeSet& rings);

    /// Throws ConfigurationError if any node of `graph` that has an
    /// edge lacks a coordinate.
    static void check_coordinates(const Graph& graph, const CoordMap* coords);

    RingFinderOptions options_;
    ShapeSet current_rings_;
    ShapeSet perimeter_rings_;
};

} // namespace rings
