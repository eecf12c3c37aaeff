#ifndef EDGEARC_GEOMETRY_HPP
#define EDGEARC_GEOMETRY_HPP

// Geometry layer public API
// Turns an edge's endpoint pair into a cubic arc and samples it

#include <math/vec2.hpp>
#include "cubic_bezier.hpp"
#include "arc_geometry.hpp"
#include "segment_sampler.hpp"

namespace edgearc {

// Usage:
//   CubicBezier arc = derive_control_polygon(
//       Vec2(0.0, 0.0), Vec2(2.0, 0.0), /*circular=*/false,
//       /*curvature=*/1.0, /*fold=*/false);
//
//   // 100 points from start to end, t running 0 -> 1
//   std::vector<SampledPoint> points = sample_bezier(arc, 100);

} // namespace edgearc

#endif // EDGEARC_GEOMETRY_HPP
