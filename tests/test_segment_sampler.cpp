#include <gtest/gtest.h>
#include <geometry/geometry.hpp>
#include "test_helpers.hpp"
#include <stdexcept>

using namespace edgearc;

namespace {

CubicBezier sample_curve() {
    return CubicBezier(Vec2(0.1, 0.3), Vec2(-1.7, 2.9), Vec2(4.4, 3.1), Vec2(2.0 / 3.0, -0.2));
}

}  // namespace

TEST(SegmentSamplerTest, EndpointsExact) {
    CubicBezier curve = sample_curve();

    for (int n : {2, 3, 7, 100, 1001}) {
        auto points = sample_bezier(curve, n);
        ASSERT_EQ(points.size(), static_cast<size_t>(n));
        EXPECT_EQ(points.front().position, curve.start());
        EXPECT_EQ(points.back().position, curve.end());
        EXPECT_EQ(points.front().t, 0.0);
        EXPECT_EQ(points.back().t, 1.0);
    }
}

TEST(SegmentSamplerTest, ParameterStrictlyIncreasing) {
    auto points = sample_bezier(sample_curve(), 100);
    for (size_t i = 1; i < points.size(); ++i) {
        EXPECT_LT(points[i - 1].t, points[i].t);
    }
}

TEST(SegmentSamplerTest, EvenlySpacedParameter) {
    auto points = sample_bezier(sample_curve(), 5);
    EXPECT_DOUBLE_EQ(points[1].t, 0.25);
    EXPECT_DOUBLE_EQ(points[2].t, 0.5);
    EXPECT_DOUBLE_EQ(points[3].t, 0.75);
}

TEST(SegmentSamplerTest, InteriorPointsOnCurve) {
    CubicBezier curve = sample_curve();
    auto points = sample_bezier(curve, 11);

    for (const auto& p : points) {
        Vec2 expected = curve.evaluate(p.t);
        EXPECT_NEAR(p.position.x, expected.x, 1e-12);
        EXPECT_NEAR(p.position.y, expected.y, 1e-12);
    }
}

TEST(SegmentSamplerTest, TwoPointsAreEndpoints) {
    CubicBezier curve = sample_curve();
    auto points = sample_bezier(curve, 2);
    EXPECT_EQ(points[0].position, curve.start());
    EXPECT_EQ(points[1].position, curve.end());
}

TEST(SegmentSamplerTest, RejectsTooFewSamples) {
    EXPECT_THROW(sample_bezier(sample_curve(), 1), std::invalid_argument);
    EXPECT_THROW(sample_bezier(sample_curve(), 0), std::invalid_argument);
    EXPECT_THROW(sample_bezier(sample_curve(), -5), std::invalid_argument);
}

TEST(SegmentSamplerTest, SampledArcMidpoint) {
    // Half-circle style arc from (0,0) to (2,0), dipping below the axis
    CubicBezier arc = derive_control_polygon(Vec2(0.0, 0.0), Vec2(2.0, 0.0), false, 1.0, false);
    auto points = sample_bezier(arc, 3);

    EXPECT_NEAR(points[1].position.x, 1.0, 1e-12);
    EXPECT_NEAR(points[1].position.y, -0.75, 1e-12);
}
