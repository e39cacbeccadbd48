#pragma once

#include "common.h"

namespace rings {

/// Tunables shared by RingFinder and PeriodicRingFinder.
struct RingFinderOptions {
    /// Periodic images tiled on each side of the unit cell.  Rings
    /// wider than roughly 2·radius cells cannot be traced whole; raise
    /// this for networks with very long rings relative to the cell.
    /// Ignored by the non-periodic finder.
    int image_radius = DEFAULT_IMAGE_RADIUS;

    /// Log per-stage counts to stderr.
    bool verbose = false;
};

} // namespace rings
