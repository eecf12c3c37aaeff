#include "segment_sampler.hpp"
#include <stdexcept>
#include <string>

namespace edgearc {

double sample_parameter(int i, int n) {
    return static_cast<double>(i) / static_cast<double>(n - 1);
}

void sample_bezier_into(const CubicBezier& curve, int n, SampledPoint* out) {
    if (n < 2) {
        throw std::invalid_argument("sample count must be at least 2, got " + std::to_string(n));
    }

    out[0] = SampledPoint(curve.start(), 0.0);
    for (int i = 1; i < n - 1; ++i) {
        double t = sample_parameter(i, n);
        out[i] = SampledPoint(curve.evaluate(t), t);
    }
    out[n - 1] = SampledPoint(curve.end(), 1.0);
}

std::vector<SampledPoint> sample_bezier(const CubicBezier& curve, int n) {
    if (n < 2) {
        throw std::invalid_argument("sample count must be at least 2, got " + std::to_string(n));
    }

    std::vector<SampledPoint> points(static_cast<size_t>(n));
    sample_bezier_into(curve, n, points.data());
    return points;
}

}  // namespace edgearc
