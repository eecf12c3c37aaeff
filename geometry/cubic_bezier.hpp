#ifndef EDGEARC_GEOMETRY_CUBIC_BEZIER_HPP
#define EDGEARC_GEOMETRY_CUBIC_BEZIER_HPP

#include <math/vec2.hpp>
#include <array>
#include <utility>

namespace edgearc {

// A single cubic Bezier curve segment (the control polygon of one arc)
struct CubicBezier {
    std::array<Vec2, 4> control_points;

    CubicBezier() = default;
    CubicBezier(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3);

    // Evaluate position at parameter t in [0, 1].
    // Returns the end points verbatim at t == 0 and t == 1.
    Vec2 evaluate(double t) const;

    // First derivative at parameter t
    Vec2 derivative(double t) const;

    // Approximate arc length (polyline through evenly spaced samples)
    double arc_length(int samples = 20) const;

    // Unit tangent, zero for a degenerate curve
    Vec2 tangent(double t) const;

    // Split curve at parameter t into two curves
    std::pair<CubicBezier, CubicBezier> split(double t) const;

    // True when all four control points lie on one line
    bool is_colinear(double tolerance = 1e-9) const;

    // Return a reversed copy of this curve (same shape, opposite direction)
    CubicBezier reversed() const {
        return CubicBezier(control_points[3], control_points[2],
                           control_points[1], control_points[0]);
    }

    // Access control points by name
    const Vec2& start() const { return control_points[0]; }
    const Vec2& control1() const { return control_points[1]; }
    const Vec2& control2() const { return control_points[2]; }
    const Vec2& end() const { return control_points[3]; }

    Vec2& start() { return control_points[0]; }
    Vec2& control1() { return control_points[1]; }
    Vec2& control2() { return control_points[2]; }
    Vec2& end() { return control_points[3]; }
};

}  // namespace edgearc

#endif // EDGEARC_GEOMETRY_CUBIC_BEZIER_HPP
