#include "cubic_bezier.hpp"
#include <algorithm>
#include <cmath>

namespace edgearc {

CubicBezier::CubicBezier(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3)
    : control_points{p0, p1, p2, p3} {}

Vec2 CubicBezier::evaluate(double t) const {
    // Bernstein form drifts by an ulp at the ends, so pin them
    if (t <= 0.0) {
        return control_points[0];
    }
    if (t >= 1.0) {
        return control_points[3];
    }

    double u = 1.0 - t;
    double tt = t * t;
    double uu = u * u;
    double ttt = tt * t;
    double uuu = uu * u;

    return control_points[0] * uuu +
           control_points[1] * (3.0 * uu * t) +
           control_points[2] * (3.0 * u * tt) +
           control_points[3] * ttt;
}

Vec2 CubicBezier::derivative(double t) const {
    double u = 1.0 - t;
    double uu = u * u;
    double tt = t * t;

    Vec2 d0 = control_points[1] - control_points[0];
    Vec2 d1 = control_points[2] - control_points[1];
    Vec2 d2 = control_points[3] - control_points[2];

    return d0 * (3.0 * uu) + d1 * (6.0 * u * t) + d2 * (3.0 * tt);
}

double CubicBezier::arc_length(int samples) const {
    samples = std::max(samples, 1);
    double length = 0.0;
    Vec2 prev = control_points[0];

    for (int i = 1; i <= samples; ++i) {
        double t = static_cast<double>(i) / static_cast<double>(samples);
        Vec2 curr = evaluate(t);
        length += (curr - prev).length();
        prev = curr;
    }
    return length;
}

Vec2 CubicBezier::tangent(double t) const {
    return derivative(t).normalized();
}

std::pair<CubicBezier, CubicBezier> CubicBezier::split(double t) const {
    // De Casteljau subdivision
    Vec2 p01 = lerp(control_points[0], control_points[1], t);
    Vec2 p12 = lerp(control_points[1], control_points[2], t);
    Vec2 p23 = lerp(control_points[2], control_points[3], t);

    Vec2 p012 = lerp(p01, p12, t);
    Vec2 p123 = lerp(p12, p23, t);

    Vec2 p0123 = lerp(p012, p123, t);

    CubicBezier left(control_points[0], p01, p012, p0123);
    CubicBezier right(p0123, p123, p23, control_points[3]);

    return {left, right};
}

bool CubicBezier::is_colinear(double tolerance) const {
    // Use the two points furthest apart as the reference line
    Vec2 origin = control_points[0];
    Vec2 axis;
    double best = 0.0;
    for (const auto& p : control_points) {
        double d = (p - origin).length_squared();
        if (d > best) {
            best = d;
            axis = p - origin;
        }
    }
    if (best == 0.0) {
        return true;
    }

    double axis_len = std::sqrt(best);
    for (const auto& p : control_points) {
        double offset = std::abs(axis.cross(p - origin)) / axis_len;
        if (offset > tolerance * std::max(1.0, axis_len)) {
            return false;
        }
    }
    return true;
}

}  // namespace edgearc
