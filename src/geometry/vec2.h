#pragma once

/// Minimal 2D vector type for node coordinates and displacements.

#include <cmath>

namespace rings {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
    Vec2& operator-=(const Vec2& o) { x -= o.x; y -= o.y; return *this; }

    friend Vec2 operator+(Vec2 a, const Vec2& b) { return a += b; }
    friend Vec2 operator-(Vec2 a, const Vec2& b) { return a -= b; }
    friend Vec2 operator*(double s, const Vec2& v) { return {s * v.x, s * v.y}; }

    /// Exact (bitwise-value) equality.  Geometric consistency checks
    /// rely on this; do not replace with a tolerance.
    friend bool operator==(const Vec2& a, const Vec2& b) {
        return a.x == b.x && a.y == b.y;
    }
    friend bool operator!=(const Vec2& a, const Vec2& b) { return !(a == b); }
};

/// z-component of the 2D cross product a × b.
inline double cross(const Vec2& a, const Vec2& b) {
    return a.x * b.y - a.y * b.x;
}

/// Polar angle of v in (−π, π], as std::atan2.
inline double angle_of(const Vec2& v) {
    return std::atan2(v.y, v.x);
}

} // namespace rings
