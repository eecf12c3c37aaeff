#include <gtest/gtest.h>
#include <geometry/geometry.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <numbers>
#include <random>

using namespace edgearc;
using namespace edgearc::test;

// ============================================
// Linear layout
// ============================================

TEST(ArcGeometryTest, HalfCircleClosedForm) {
    CubicBezier arc = derive_control_polygon(Vec2(0.0, 0.0), Vec2(2.0, 0.0), false, 1.0, false);

    // edge angle 0, d = 1, bend pi/2
    EXPECT_NEAR(arc.control1().x, 0.0, 1e-12);
    EXPECT_NEAR(arc.control1().y, -1.0, 1e-12);
    EXPECT_NEAR(arc.control2().x, 2.0, 1e-12);
    EXPECT_NEAR(arc.control2().y, -1.0, 1e-12);
}

TEST(ArcGeometryTest, NegativeCurvatureFlipsSide) {
    CubicBezier arc = derive_control_polygon(Vec2(0.0, 0.0), Vec2(2.0, 0.0), false, -1.0, false);

    EXPECT_NEAR(arc.control1().x, 0.0, 1e-12);
    EXPECT_NEAR(arc.control1().y, 1.0, 1e-12);
    EXPECT_NEAR(arc.control2().x, 2.0, 1e-12);
    EXPECT_NEAR(arc.control2().y, 1.0, 1e-12);
}

TEST(ArcGeometryTest, PartialCurvature) {
    CubicBezier arc = derive_control_polygon(Vec2(0.0, 0.0), Vec2(4.0, 0.0), false, 0.5, false);

    double d = 2.0;
    double a = std::numbers::pi / 4.0;
    EXPECT_NEAR(arc.control1().x, d * std::cos(-a), 1e-12);
    EXPECT_NEAR(arc.control1().y, d * std::sin(-a), 1e-12);
    EXPECT_NEAR(arc.control2().x, 4.0 + d * std::cos(-std::numbers::pi + a), 1e-12);
    EXPECT_NEAR(arc.control2().y, d * std::sin(-std::numbers::pi + a), 1e-12);
}

TEST(ArcGeometryTest, RotatedEdgeFollowsEdgeAngle) {
    // Vertical edge, bending to the right of travel direction
    CubicBezier arc = derive_control_polygon(Vec2(0.0, 0.0), Vec2(0.0, 2.0), false, 1.0, false);

    EXPECT_NEAR(arc.control1().x, 1.0, 1e-12);
    EXPECT_NEAR(arc.control1().y, 0.0, 1e-12);
    EXPECT_NEAR(arc.control2().x, 1.0, 1e-12);
    EXPECT_NEAR(arc.control2().y, 2.0, 1e-12);
}

TEST(ArcGeometryTest, ZeroCurvatureIsStraight) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> coord(-50.0, 50.0);

    for (int i = 0; i < 200; ++i) {
        Vec2 start(coord(rng), coord(rng));
        Vec2 end(coord(rng), coord(rng));
        CubicBezier arc = derive_control_polygon(start, end, false, 0.0, false);
        EXPECT_TRUE(arc.is_colinear(1e-9)) << "start " << start << " end " << end;
    }
}

TEST(ArcGeometryTest, ControlDistanceIsHalfChord) {
    Vec2 start(1.0, 1.0);
    Vec2 end(4.0, 5.0);
    CubicBezier arc = derive_control_polygon(start, end, false, 0.3, false);

    EXPECT_NEAR(arc.control1().distance_to(start), 2.5, 1e-12);
    EXPECT_NEAR(arc.control2().distance_to(end), 2.5, 1e-12);
}

TEST(ArcGeometryTest, EndpointsPreservedExactly) {
    std::mt19937 rng(11);
    std::uniform_real_distribution<double> coord(-10.0, 10.0);
    std::uniform_real_distribution<double> bend(-2.0, 2.0);

    for (int i = 0; i < 200; ++i) {
        Vec2 start(coord(rng), coord(rng));
        Vec2 end(coord(rng), coord(rng));
        bool circular = i % 3 == 0;
        bool fold = i % 2 == 0;

        CubicBezier arc = derive_control_polygon(start, end, circular, bend(rng), fold);
        EXPECT_EQ(arc.start(), start);
        EXPECT_EQ(arc.end(), end);
    }
}

TEST(ArcGeometryTest, CoincidentEndpointsDegenerate) {
    Vec2 p(3.0, -2.0);
    CubicBezier arc = derive_control_polygon(p, p, false, 1.0, false);

    EXPECT_EQ(arc.start(), p);
    EXPECT_EQ(arc.control1(), p);
    EXPECT_EQ(arc.control2(), p);
    EXPECT_EQ(arc.end(), p);
}

// ============================================
// Fold
// ============================================

TEST(ArcGeometryTest, FoldPutsReversedEdgesOnSameSide) {
    CubicBezier forward = derive_control_polygon(Vec2(0.0, 0.0), Vec2(2.0, 0.0), false, 1.0, false);
    CubicBezier backward = derive_control_polygon(Vec2(2.0, 0.0), Vec2(0.0, 0.0), false, 1.0, false);

    // Opposite sides without folding
    EXPECT_LT(forward.control1().y, 0.0);
    EXPECT_GT(backward.control1().y, 0.0);

    CubicBezier folded_fwd = derive_control_polygon(Vec2(0.0, 0.0), Vec2(2.0, 0.0), false, 1.0, true);
    CubicBezier folded_bwd = derive_control_polygon(Vec2(2.0, 0.0), Vec2(0.0, 0.0), false, 1.0, true);

    EXPECT_NEAR(folded_fwd.control1().y, 1.0, 1e-12);
    EXPECT_NEAR(folded_fwd.control2().y, 1.0, 1e-12);
    EXPECT_NEAR(folded_bwd.control1().y, 1.0, 1e-12);
    EXPECT_NEAR(folded_bwd.control2().y, 1.0, 1e-12);
}

TEST(ArcGeometryTest, FoldLeavesXUntouched) {
    CubicBezier plain = derive_control_polygon(Vec2(-3.0, 1.0), Vec2(5.0, 2.0), false, 0.7, false);
    CubicBezier folded = derive_control_polygon(Vec2(-3.0, 1.0), Vec2(5.0, 2.0), false, 0.7, true);

    EXPECT_EQ(folded.control1().x, plain.control1().x);
    EXPECT_EQ(folded.control2().x, plain.control2().x);
    EXPECT_EQ(folded.control1().y, std::abs(plain.control1().y));
    EXPECT_EQ(folded.control2().y, std::abs(plain.control2().y));
}

TEST(ArcGeometryTest, FoldNegativeCurvature) {
    CubicBezier folded = derive_control_polygon(Vec2(0.0, 0.0), Vec2(2.0, 0.0), false, -1.0, true);
    EXPECT_NEAR(folded.control1().y, -1.0, 1e-12);
    EXPECT_NEAR(folded.control2().y, -1.0, 1e-12);
}

TEST(ArcGeometryTest, FoldIsIdempotent) {
    for (double curvature : {1.0, 0.4, -0.6}) {
        CubicBezier once = derive_control_polygon(Vec2(1.0, -2.0), Vec2(-4.0, 3.0), false, curvature, true);
        CubicBezier twice = once;
        fold_control_points(twice, curvature);

        for (size_t i = 0; i < 4; ++i) {
            EXPECT_EQ(twice.control_points[i], once.control_points[i]);
        }
    }
}

TEST(ArcGeometryTest, FoldWithZeroCurvatureFlattensControls) {
    CubicBezier folded = derive_control_polygon(Vec2(0.0, 3.0), Vec2(2.0, 3.0), false, 0.0, true);
    EXPECT_EQ(folded.control1().y, 0.0);
    EXPECT_EQ(folded.control2().y, 0.0);
}

TEST(ArcGeometryTest, SignumOfZero) {
    EXPECT_EQ(signum(0.0), 0.0);
    EXPECT_EQ(signum(-0.0), 0.0);
    EXPECT_EQ(signum(2.5), 1.0);
    EXPECT_EQ(signum(-0.1), -1.0);
}

// ============================================
// Circular layout
// ============================================

TEST(ArcGeometryTest, CircularQuarterChord) {
    Vec2 start(1.0, 0.0);
    Vec2 end(0.0, 1.0);
    CubicBezier arc = derive_control_polygon(start, end, true, 1.0, false);

    double scale = 1.0 - (std::sqrt(2.0) / 2.0);
    EXPECT_NEAR(arc.control1().x, scale, 1e-12);
    EXPECT_NEAR(arc.control1().y, 0.0, 1e-12);
    EXPECT_NEAR(arc.control2().x, 0.0, 1e-12);
    EXPECT_NEAR(arc.control2().y, scale, 1e-12);
}

TEST(ArcGeometryTest, CircularRatioBothOrderings) {
    auto nodes = ring(12, 5.0);

    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t j = 0; j < nodes.size(); ++j) {
            if (i == j) continue;
            const Vec2& a = nodes[i];
            const Vec2& b = nodes[j];
            double d = a.distance_to(b) / 2.0;

            CubicBezier ab = derive_control_polygon(a, b, true, 1.0, false);
            CubicBezier ba = derive_control_polygon(b, a, true, 1.0, false);

            EXPECT_NEAR(ab.control1().length() / a.length(), 1.0 - d / b.length(), 1e-9);
            EXPECT_NEAR(ab.control2().length() / b.length(), 1.0 - d / b.length(), 1e-9);
            EXPECT_NEAR(ba.control1().length() / b.length(), 1.0 - d / a.length(), 1e-9);
            EXPECT_NEAR(ba.control2().length() / a.length(), 1.0 - d / a.length(), 1e-9);
        }
    }
}

TEST(ArcGeometryTest, CircularLongerChordsBowFurther) {
    auto nodes = ring(8, 1.0);
    CubicBezier near = derive_control_polygon(nodes[0], nodes[1], true, 1.0, false);
    CubicBezier far = derive_control_polygon(nodes[0], nodes[4], true, 1.0, false);

    EXPECT_LT(far.control1().length(), near.control1().length());
    // Diametric chord pulls the controls onto the centre
    EXPECT_NEAR(far.control1().length(), 0.0, 1e-12);
}

TEST(ArcGeometryTest, CircularUsesEndRadiusForBothControls) {
    // Start sits off the ring: its own radius is ignored
    Vec2 start(2.0, 0.0);
    Vec2 end(0.0, 1.0);
    double d = start.distance_to(end) / 2.0;
    double scale = 1.0 - d / end.length();

    CubicBezier arc = derive_control_polygon(start, end, true, 1.0, false);
    EXPECT_NEAR(arc.control1().x, start.x * scale, 1e-12);
    EXPECT_NEAR(arc.control1().y, 0.0, 1e-12);
    EXPECT_NEAR(arc.control2().y, end.y * scale, 1e-12);
}

TEST(ArcGeometryTest, CircularIgnoresCurvatureAndFold) {
    Vec2 start(0.0, 3.0);
    Vec2 end(3.0, 0.0);
    CubicBezier a = derive_control_polygon(start, end, true, 1.0, false);
    CubicBezier b = derive_control_polygon(start, end, true, -0.4, true);

    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(a.control_points[i], b.control_points[i]);
    }
}

TEST(ArcGeometryTest, CircularEndAtOriginCollapses) {
    CubicBezier arc = derive_control_polygon(Vec2(1.0, 1.0), vec2::zero(), true, 1.0, false);

    EXPECT_EQ(arc.control1(), vec2::zero());
    EXPECT_EQ(arc.control2(), vec2::zero());
    EXPECT_TRUE(arc.control1().is_finite());
    EXPECT_EQ(arc.start(), Vec2(1.0, 1.0));
}

TEST(ArcGeometryTest, CircularCoincidentEndpoints) {
    Vec2 p(0.0, 4.0);
    CubicBezier arc = derive_control_polygon(p, p, true, 1.0, false);
    EXPECT_EQ(arc.control1(), p);
    EXPECT_EQ(arc.control2(), p);
}
