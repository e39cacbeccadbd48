#pragma once

/// Ring extraction for a graph embedded in a rectangular periodic cell.
///
/// Edges longer than half the cell along an axis are taken to wrap
/// around that boundary (minimum-image convention).  The graph is
/// tiled over a (2R+1)×(2R+1) block of images, where every edge is a
/// genuine straight segment, and traced like the finite case.  Each
/// physical ring then shows up once per image it fits in; rings are
/// keyed by their nodes' image offsets relative to the smallest node
/// and only one copy of each is kept.
///
/// Reported rings use the caller's node ids.  Each carries its own
/// coordinate map with unwrapped positions, placed so that its
/// smallest node lies in the origin cell.

#include "finder/ring_finder.h"
#include "geometry/vec2.h"

namespace rings {

class PeriodicRingFinder : public RingFinder {
public:
    /// `cell` is the size of the orthorhombic unit cell; both
    /// components must be positive.  options.image_radius must be ≥ 1.
    PeriodicRingFinder(const Graph& graph,
                       std::shared_ptr<const CoordMap> coords,
                       Vec2 cell,
                       RingFinderOptions options = {});

    const Vec2& cell() const noexcept { return cell_; }
    int image_radius() const noexcept { return options_.image_radius; }

private:
    Vec2 cell_;
};

} // namespace rings
