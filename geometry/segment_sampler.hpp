#ifndef EDGEARC_GEOMETRY_SEGMENT_SAMPLER_HPP
#define EDGEARC_GEOMETRY_SEGMENT_SAMPLER_HPP

#include <math/vec2.hpp>
#include "cubic_bezier.hpp"
#include <vector>

namespace edgearc {

// One vertex of a sampled arc
struct SampledPoint {
    Vec2 position;
    double t = 0.0;  // Position along path, 0 at start, 1 at end

    SampledPoint() = default;
    SampledPoint(const Vec2& pos, double t_) : position(pos), t(t_) {}
};

// Parameter value of sample i out of n, i / (n - 1)
double sample_parameter(int i, int n);

// Evaluate the curve at n evenly spaced parameter values.
// The first and last points are the curve's end points verbatim.
// Throws std::invalid_argument when n < 2.
std::vector<SampledPoint> sample_bezier(const CubicBezier& curve, int n);

// Same as sample_bezier but writes into out[0 .. n), which must be sized.
void sample_bezier_into(const CubicBezier& curve, int n, SampledPoint* out);

}  // namespace edgearc

#endif // EDGEARC_GEOMETRY_SEGMENT_SAMPLER_HPP
