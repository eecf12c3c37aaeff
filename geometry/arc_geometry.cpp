#include "arc_geometry.hpp"
#include <cmath>
#include <numbers>

namespace edgearc {

namespace {

CubicBezier circular_polygon(const Vec2& start, const Vec2& end) {
    double node_dist = start.distance_to(end) / 2.0;
    double radius = end.length();

    if (radius == 0.0) {
        return CubicBezier(start, vec2::zero(), vec2::zero(), end);
    }

    double scale = 1.0 - node_dist / radius;
    return CubicBezier(start, start * scale, end * scale, end);
}

CubicBezier linear_polygon(const Vec2& start, const Vec2& end, double curvature) {
    double node_dist = start.distance_to(end) / 2.0;
    double bend_angle = std::numbers::pi / 2.0 * curvature;
    double edge_angle = (end - start).angle();

    double start_angle = edge_angle - bend_angle;
    double end_angle = edge_angle - std::numbers::pi + bend_angle;

    return CubicBezier(start,
                       start + Vec2::from_polar(node_dist, start_angle),
                       end + Vec2::from_polar(node_dist, end_angle),
                       end);
}

}  // namespace

double signum(double value) {
    if (value > 0.0) return 1.0;
    if (value < 0.0) return -1.0;
    return 0.0;
}

void fold_control_points(CubicBezier& polygon, double curvature) {
    double side = signum(curvature);
    // x is left alone on purpose
    polygon.control1().y = std::abs(polygon.control1().y) * side;
    polygon.control2().y = std::abs(polygon.control2().y) * side;
}

CubicBezier derive_control_polygon(const Vec2& start, const Vec2& end,
                                   bool circular, double curvature, bool fold) {
    if (circular) {
        return circular_polygon(start, end);
    }

    CubicBezier polygon = linear_polygon(start, end, curvature);
    if (fold) {
        fold_control_points(polygon, curvature);
    }
    return polygon;
}

}  // namespace edgearc
