#pragma once

/// Common types, constants and sentinel values used throughout the codebase.

#include <cstddef>
#include <limits>

namespace rings {

/// A graph node handle.  Nodes carry no data; geometry is looked up
/// in a separate coordinate map keyed by this id.
using NodeId = std::size_t;

/// Sentinel value meaning "no valid index."
inline constexpr std::size_t NONE = std::numeric_limits<std::size_t>::max();

/// Default number of periodic images tiled on each side of the unit
/// cell (1 → a 3×3 block).  Enough whenever no edge spans more than
/// half a cell.
inline constexpr int DEFAULT_IMAGE_RADIUS = 1;

} // namespace rings
