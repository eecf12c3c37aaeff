#ifndef EDGEARC_GEOMETRY_ARC_GEOMETRY_HPP
#define EDGEARC_GEOMETRY_ARC_GEOMETRY_HPP

#include <math/vec2.hpp>
#include "cubic_bezier.hpp"

namespace edgearc {

// Derive the cubic control polygon for one edge drawn as an arc.
//
// The returned curve always has start() == start and end() == end.
//
// Circular layout (both nodes on a ring centred at the origin):
//   d = |end - start| / 2, r = |end|
//   P1 = start * (1 - d/r), P2 = end * (1 - d/r)
//   The end point's radius is used for both control points. An end point at
//   the origin collapses both control points onto the origin.
//
// Linear layout:
//   edge_angle = atan2(end - start), bend = pi/2 * curvature
//   P1 = start + d * (cos, sin)(edge_angle - bend)
//   P2 = end   + d * (cos, sin)(edge_angle - pi + bend)
//   When fold is set, both control points get y = |y| * sign(curvature).
//
// Coincident endpoints give a zero-length arc, never an error.
CubicBezier derive_control_polygon(const Vec2& start, const Vec2& end,
                                   bool circular, double curvature, bool fold);

// Force both interior control points to the side given by the curvature
// sign. Only the y component is touched.
void fold_control_points(CubicBezier& polygon, double curvature);

// sign(x) with sign(0) == 0
double signum(double value);

}  // namespace edgearc

#endif // EDGEARC_GEOMETRY_ARC_GEOMETRY_HPP
