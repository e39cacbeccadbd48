#include "finder/periodic_wrap.h"

#include "error.h"

#include <cmath>
#include <string>

namespace rings {

namespace {

int wrap_axis(double d, double length) {
    if (std::abs(d) <= 0.5 * length) return 0;
    return d > 0.0 ? -1 : 1;
}

} // namespace

ImageOffset minimum_image_wrap(const Vec2& d, const Vec2& cell) {
    return {wrap_axis(d.x, cell.x), wrap_axis(d.y, cell.y)};
}

ImageOffset wrap_sum(const std::vector<NodeId>& ring, const WrapMap& wrap) {
    ImageOffset sum;
    const std::size_t n = ring.size();
    for (std::size_t i = 0; i < n; ++i) {
        const NodeId from = ring[i];
        const NodeId to   = ring[(i + 1) % n];
        const Edge e(from, to);
        auto it = wrap.find(e);
        if (it == wrap.end()) {
            throw GeometryError("ring step " + std::to_string(from) + " -> "
                                + std::to_string(to) + " is not a graph edge");
        }
        sum = from == e.a ? sum + it->second : sum - it->second;
    }
    return sum;
}

void check_wrap_sum(const std::vector<NodeId>& ring, const WrapMap& wrap) {
    const ImageOffset sum = wrap_sum(ring, wrap);
    if (sum != ImageOffset{}) {
        throw GeometryError("ring through node "
                            + std::to_string(ring.empty() ? NodeId{0} : ring.front())
                            + " has wrap vectors summing to ("
                            + std::to_string(sum.x) + ", "
                            + std::to_string(sum.y) + "), not zero");
    }
}

} // namespace rings
