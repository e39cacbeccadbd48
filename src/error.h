#pragma once

/// Exception types raised by the ring finder.
///
/// Both derive from the standard hierarchy so callers that only care
/// about "something went wrong" can catch std::exception.

#include <stdexcept>
#include <string>

namespace rings {

/// Bad input: missing coordinates, malformed edges, invalid periodic
/// cell, unreadable fixture files.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// The input is well-formed but geometrically inconsistent: shapes
/// that disagree on where a node lives, rings whose periodic wrap
/// vectors do not cancel, overlapping edges, or a geometric query on
/// a shape without coordinates.
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace rings
