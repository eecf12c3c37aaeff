#include <gtest/gtest.h>
#include <math/vec2.hpp>
#include <cmath>
#include <numbers>

using namespace edgearc;

TEST(Vec2Test, DefaultConstruction) {
    Vec2 v;
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
}

TEST(Vec2Test, Arithmetic) {
    Vec2 a(1.0, 2.0);
    Vec2 b(4.0, 6.0);

    Vec2 sum = a + b;
    EXPECT_DOUBLE_EQ(sum.x, 5.0);
    EXPECT_DOUBLE_EQ(sum.y, 8.0);

    Vec2 diff = b - a;
    EXPECT_DOUBLE_EQ(diff.x, 3.0);
    EXPECT_DOUBLE_EQ(diff.y, 4.0);

    Vec2 scaled = 2.0 * a;
    EXPECT_DOUBLE_EQ(scaled.x, 2.0);
    EXPECT_DOUBLE_EQ(scaled.y, 4.0);
}

TEST(Vec2Test, LengthAndDistance) {
    Vec2 v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(Vec2(1.0, 1.0).distance_to(Vec2(4.0, 5.0)), 5.0);
}

TEST(Vec2Test, NormalizedZeroVector) {
    Vec2 n = vec2::zero().normalized();
    EXPECT_EQ(n, vec2::zero());
}

TEST(Vec2Test, CrossIsSignedArea) {
    EXPECT_DOUBLE_EQ(vec2::unit_x().cross(vec2::unit_y()), 1.0);
    EXPECT_DOUBLE_EQ(vec2::unit_y().cross(vec2::unit_x()), -1.0);
}

TEST(Vec2Test, AngleAndPolar) {
    EXPECT_DOUBLE_EQ(Vec2(0.0, 1.0).angle(), std::numbers::pi / 2.0);
    EXPECT_DOUBLE_EQ(Vec2(-1.0, 0.0).angle(), std::numbers::pi);
    EXPECT_DOUBLE_EQ(vec2::zero().angle(), 0.0);

    Vec2 p = Vec2::from_polar(2.0, std::numbers::pi / 2.0);
    EXPECT_NEAR(p.x, 0.0, 1e-12);
    EXPECT_NEAR(p.y, 2.0, 1e-12);
}

TEST(Vec2Test, Lerp) {
    Vec2 mid = lerp(Vec2(0.0, 0.0), Vec2(2.0, 4.0), 0.5);
    EXPECT_DOUBLE_EQ(mid.x, 1.0);
    EXPECT_DOUBLE_EQ(mid.y, 2.0);
}

TEST(Vec2Test, Finite) {
    EXPECT_TRUE(Vec2(1.0, 2.0).is_finite());
    EXPECT_FALSE(Vec2(std::nan(""), 2.0).is_finite());
}

TEST(Vec2Test, DotAndIndex) {
    Vec2 a(1.0, 2.0);
    Vec2 b(3.0, -4.0);
    EXPECT_DOUBLE_EQ(a.dot(b), -5.0);
    EXPECT_DOUBLE_EQ(vec2::unit_x().dot(vec2::unit_y()), 0.0);
    EXPECT_DOUBLE_EQ(a.dot(a), a.length_squared());

    EXPECT_DOUBLE_EQ(b[0], 3.0);
    EXPECT_DOUBLE_EQ(b[1], -4.0);
}
