#pragma once

/// Minimum-image wrap bookkeeping for periodic networks.

#include "common.h"
#include "geometry/edge.h"
#include "geometry/vec2.h"

#include <unordered_map>
#include <vector>

namespace rings {

/// Integer lattice translation, in whole cells.
struct ImageOffset {
    int x = 0;
    int y = 0;

    friend ImageOffset operator+(ImageOffset a, ImageOffset b) {
        return {a.x + b.x, a.y + b.y};
    }
    friend ImageOffset operator-(ImageOffset a, ImageOffset b) {
        return {a.x - b.x, a.y - b.y};
    }
    friend bool operator==(ImageOffset a, ImageOffset b) {
        return a.x == b.x && a.y == b.y;
    }
    friend bool operator!=(ImageOffset a, ImageOffset b) { return !(a == b); }
};

/// wrap.at(e) is the image of e.b, relative to e.a's cell, that e.a
/// connects to.
using WrapMap = std::unordered_map<Edge, ImageOffset, EdgeHash>;

/// Wrap vector of a displacement `d` between two points folded into
/// the cell.  An axis wraps only when |d| is strictly more than half
/// the cell; exactly half a cell stays in place.
ImageOffset minimum_image_wrap(const Vec2& d, const Vec2& cell);

/// Sum of the half-edge wrap vectors around the closed node cycle
/// `ring` (last node joins back to the first).  Throws GeometryError
/// if a step is not an edge of `wrap`.
ImageOffset wrap_sum(const std::vector<NodeId>& ring, const WrapMap& wrap);

/// Throws GeometryError unless wrap_sum(ring, wrap) is zero, i.e. the
/// ring closes inside one cell instead of winding around the torus.
void check_wrap_sum(const std::vector<NodeId>& ring, const WrapMap& wrap);

} // namespace rings
