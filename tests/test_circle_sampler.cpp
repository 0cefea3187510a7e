#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>

#include "rqz_circle/circle_sampler.hpp"
#include "rqz_circle/dms.hpp"
#include "rqz_circle/errors.hpp"

using namespace rqz_circle;

namespace {

// 78°56'34.68"N 11°51'19.78"E
GeoPoint brandal() {
    return dms_to_decimal(DmsAngle{78, 56, 34.68}, DmsAngle{11, 51, 19.78});
}

bool has_at_most_six_decimals(double v) {
    const double scaled = v * 1e6;
    return std::abs(scaled - std::round(scaled)) < 1e-6;
}

} // namespace

class CircleSamplerTest : public ::testing::Test {
protected:
    GeodesicEngine engine;
};

// =============================================================================
// Ring shape
// =============================================================================

TEST_F(CircleSamplerTest, ObservatoryZoneScenario) {
    const CircleSpec spec{brandal(), 900.0, 90};
    const CirclePointRing ring = generate_circle(engine, spec);

    ASSERT_EQ(ring.size(), 91u);
    EXPECT_EQ(ring.front(), ring.back());

    // 丸め後の点なので許容誤差は 0.1 m（丸めによる移動は最大でも数 cm）
    for (std::size_t i = 0; i < ring.size(); i++) {
        EXPECT_NEAR(engine.distance(spec.center, ring[i]), 900.0, 0.1) << "point " << i;
    }
}

TEST_F(CircleSamplerTest, UnroundedSamplesSitExactlyOnTheRadius) {
    const CircleSpec spec{brandal(), 900.0, 90};
    for (int i = 0; i <= spec.num_points; i++) {
        const GeoPoint p = engine.solve_direct(spec.center, spec.radius_m, bearing_at(spec, i));
        EXPECT_NEAR(engine.distance(spec.center, p), 900.0, 1e-6) << "point " << i;
    }
}

TEST_F(CircleSamplerTest, CardinalityIsNumPointsPlusOne) {
    for (int n : {1, 2, 3, 7, 90, 360}) {
        const CirclePointRing ring = generate_circle(engine, CircleSpec{brandal(), 500.0, n});
        EXPECT_EQ(ring.size(), static_cast<std::size_t>(n) + 1) << "n = " << n;
        EXPECT_EQ(ring.front(), ring.back()) << "n = " << n;
    }
}

TEST_F(CircleSamplerTest, SinglePointRingIsDegenerateButClosed) {
    const CirclePointRing ring = generate_circle(engine, CircleSpec{brandal(), 900.0, 1});
    ASSERT_EQ(ring.size(), 2u);
    EXPECT_EQ(ring[0], ring[1]);
    EXPECT_GT(ring[0].lat, brandal().lat); // bearing 0 = 真北
}

TEST_F(CircleSamplerTest, OneMetreRadiusStillYieldsAllSamples) {
    const CircleSpec spec{brandal(), 1.0, 90};
    const CirclePointRing ring = generate_circle(engine, spec);
    ASSERT_EQ(ring.size(), 91u);
    EXPECT_EQ(ring.front(), ring.back());
    for (const auto& p : ring) {
        EXPECT_NEAR(engine.distance(spec.center, p), 1.0, 0.1);
    }
}

TEST_F(CircleSamplerTest, CoordinatesAreRoundedToSixDecimals) {
    const CirclePointRing ring = generate_circle(engine, CircleSpec{brandal(), 900.0, 36});
    for (const auto& p : ring) {
        EXPECT_TRUE(has_at_most_six_decimals(p.lat)) << p.lat;
        EXPECT_TRUE(has_at_most_six_decimals(p.lon)) << p.lon;
    }
    EXPECT_DOUBLE_EQ(round_coordinate(11.8554944444), 11.855494);
    EXPECT_DOUBLE_EQ(round_coordinate(-11.8554946), -11.855495);
}

TEST(CircleSamplerRoundingTest, TinyNegativeValuesRoundToPositiveZero) {
    EXPECT_EQ(round_coordinate(-3e-7), 0.0);
    EXPECT_FALSE(std::signbit(round_coordinate(-3e-7)));
    EXPECT_FALSE(std::signbit(round_coordinate(-0.0)));
    EXPECT_DOUBLE_EQ(round_coordinate(-6e-7), -0.000001);
}

TEST_F(CircleSamplerTest, RingAcrossPrimeMeridianHasNoNegativeZero) {
    // 経度 0 上の中心なら真北・真南の点の経度は 0 付近に丸められる
    const CirclePointRing ring = generate_circle(engine, CircleSpec{GeoPoint{10.0, 0.0}, 900.0, 4});
    ASSERT_EQ(ring.size(), 5u);
    for (const auto& p : ring) {
        EXPECT_FALSE(p.lon == 0.0 && std::signbit(p.lon));
        EXPECT_FALSE(p.lat == 0.0 && std::signbit(p.lat));
    }
    EXPECT_FALSE(std::signbit(ring[2].lon)) << ring[2].lon;
}

TEST_F(CircleSamplerTest, IsDeterministic) {
    const CircleSpec spec{brandal(), 900.0, 90};
    const CirclePointRing a = generate_circle(engine, spec);
    const CirclePointRing b = generate_circle(engine, spec);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(a[i], b[i]) << "point " << i;
    }
}

TEST_F(CircleSamplerTest, RingRunsClockwiseFromNorth) {
    const GeoPoint c = brandal();
    const CirclePointRing ring = generate_circle(engine, CircleSpec{c, 900.0, 4});
    ASSERT_EQ(ring.size(), 5u);
    EXPECT_GT(ring[0].lat, c.lat); // N
    EXPECT_GT(ring[1].lon, c.lon); // E
    EXPECT_LT(ring[2].lat, c.lat); // S
    EXPECT_LT(ring[3].lon, c.lon); // W
}

// =============================================================================
// Bearings
// =============================================================================

TEST(CircleSamplerBearingTest, EvenlySpacedFullRotation) {
    const CircleSpec spec{GeoPoint{0.0, 0.0}, 100.0, 90};
    EXPECT_DOUBLE_EQ(bearing_at(spec, 0), 0.0);
    EXPECT_DOUBLE_EQ(bearing_at(spec, 1), 4.0);
    EXPECT_DOUBLE_EQ(bearing_at(spec, 45), 180.0);
    EXPECT_DOUBLE_EQ(bearing_at(spec, 90), 360.0);

    for (int i = 1; i <= spec.num_points; i++) {
        EXPECT_NEAR(bearing_at(spec, i) - bearing_at(spec, i - 1), 4.0, 1e-12);
    }
}

TEST(CircleSamplerBearingTest, LastBearingIsExactly360) {
    for (int n : {1, 3, 7, 11, 90, 97}) {
        const CircleSpec spec{GeoPoint{0.0, 0.0}, 100.0, n};
        EXPECT_EQ(bearing_at(spec, n), 360.0) << "n = " << n;
    }
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(CircleSamplerTest, RejectsNonPositivePointCount) {
    EXPECT_THROW(generate_circle(engine, CircleSpec{brandal(), 900.0, 0}), InvalidInput);
    EXPECT_THROW(generate_circle(engine, CircleSpec{brandal(), 900.0, -3}), InvalidInput);
}

TEST_F(CircleSamplerTest, RejectsNonPositiveRadius) {
    EXPECT_THROW(generate_circle(engine, CircleSpec{brandal(), 0.0, 90}), InvalidInput);
    EXPECT_THROW(generate_circle(engine, CircleSpec{brandal(), -900.0, 90}), InvalidInput);
}

TEST_F(CircleSamplerTest, PropagatesGeodesicInputErrors) {
    EXPECT_THROW(generate_circle(engine, CircleSpec{GeoPoint{95.0, 0.0}, 900.0, 90}), InvalidInput);
}
