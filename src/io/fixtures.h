#pragma once

/// Plain-text network fixtures.
///
///   edges:   one edge per line, "u v" or "u, v"
///   coords:  one node per line, "x y" (id = index among data lines)
///            or "id, x, y"
///   rings:   one ring per line, its node ids separated by whitespace
///
/// Blank lines and lines starting with '#' are skipped everywhere.
/// Malformed lines raise ConfigurationError naming the line number.

#include "common.h"
#include "geometry/edge.h"
#include "geometry/shape.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace rings {

std::vector<Edge> read_edge_list(std::istream& in);
std::vector<Edge> read_edge_list(const std::string& path);

CoordMap read_coordinates(std::istream& in);
CoordMap read_coordinates(const std::string& path);

/// Each ring as its listed node ids; ring size is the list length.
std::vector<std::vector<NodeId>> read_rings(std::istream& in);
std::vector<std::vector<NodeId>> read_rings(const std::string& path);

} // namespace rings
