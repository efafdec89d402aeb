#include <gtest/gtest.h>
#include <accelmath/simd.hpp>
#include <cmath>

using namespace accelmath::simd;

TEST(SimdTest, MulAddDouble3) {
    double3 p(1, 2, 3);
    double3 q(3, 4, 5);
    double3 r = muladd(10.0, p, q);

    EXPECT_DOUBLE_EQ(r[0], 13.0);
    EXPECT_DOUBLE_EQ(r[1], 24.0);
    EXPECT_DOUBLE_EQ(r[2], 35.0);

    // Same thing written as an expression
    double3 expr = 10.0 * p + q;
    EXPECT_EQ(r, expr);
}

TEST(SimdTest, MulAddFloat4) {
    float4 x(1, -1, 0.5f, 2);
    float4 y(0, 1, 1, 1);
    float4 r = muladd(2.0f, x, y);
    EXPECT_FLOAT_EQ(r[0], 2.0f);
    EXPECT_FLOAT_EQ(r[1], -1.0f);
    EXPECT_FLOAT_EQ(r[2], 2.0f);
    EXPECT_FLOAT_EQ(r[3], 5.0f);
}

TEST(SimdTest, GeometricHelpers) {
    double3 a(1, 2, 3);
    double3 b(3, 4, 5);

    EXPECT_DOUBLE_EQ(dot(a, b), 26.0);
    EXPECT_DOUBLE_EQ(length_squared(a), 14.0);
    EXPECT_DOUBLE_EQ(length(a), std::sqrt(14.0));
    EXPECT_DOUBLE_EQ(distance_squared(a, b), 12.0);
    EXPECT_DOUBLE_EQ(distance(a, b), std::sqrt(12.0));

    float2 origin(0, 0);
    float2 corner(3, 4);
    EXPECT_FLOAT_EQ(distance(origin, corner), 5.0f);
}

TEST(SimdTest, NormalizeKeepsZeroVector) {
    double3 v(0, 3, 4);
    double3 n = normalize(v);
    EXPECT_NEAR(length(n), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(n[1], 0.6);
    EXPECT_DOUBLE_EQ(n[2], 0.8);

    double3 zero = double3::Zero();
    EXPECT_EQ(normalize(zero), zero);
}

TEST(SimdTest, CrossProduct) {
    float3 x(1, 0, 0);
    float3 y(0, 1, 0);
    float3 z = cross(x, y);
    EXPECT_FLOAT_EQ(z[0], 0.0f);
    EXPECT_FLOAT_EQ(z[1], 0.0f);
    EXPECT_FLOAT_EQ(z[2], 1.0f);
    EXPECT_FLOAT_EQ(dot(z, x), 0.0f);
}

TEST(SimdTest, MixAndClamp) {
    double2 a(0, 10);
    double2 b(10, 20);
    double2 mid = mix(a, b, 0.5);
    EXPECT_DOUBLE_EQ(mid[0], 5.0);
    EXPECT_DOUBLE_EQ(mid[1], 15.0);
    EXPECT_EQ(mix(a, b, 0.0), a);
    EXPECT_EQ(mix(a, b, 1.0), b);

    float4 v(-2, 0.5f, 3, 1);
    float4 c = clamp(v, 0.0f, 1.0f);
    EXPECT_FLOAT_EQ(c[0], 0.0f);
    EXPECT_FLOAT_EQ(c[1], 0.5f);
    EXPECT_FLOAT_EQ(c[2], 1.0f);
    EXPECT_FLOAT_EQ(c[3], 1.0f);
}

TEST(SimdTest, Reductions) {
    double4 v(4, -1, 7, 2);
    EXPECT_DOUBLE_EQ(reduce_add(v), 12.0);
    EXPECT_DOUBLE_EQ(reduce_min(v), -1.0);
    EXPECT_DOUBLE_EQ(reduce_max(v), 7.0);
}
