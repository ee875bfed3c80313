// File: tests/geo/geo_distance_test.cpp
#include "geo/geo_distance.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace apo {
namespace {

const Coordinate kNewYork(40.7128, -74.0060);
const Coordinate kLosAngeles(34.0522, -118.2437);

// ============================================================================
// Validation Tests
// ============================================================================

TEST(GeoDistanceTest, ValidCoordinatesIncludeBounds) {
    EXPECT_TRUE(IsValidCoordinate(Coordinate(90.0, 180.0)));
    EXPECT_TRUE(IsValidCoordinate(Coordinate(-90.0, -180.0)));
    EXPECT_TRUE(IsValidCoordinate(kNewYork));
}

TEST(GeoDistanceTest, InvalidCoordinatesRejected) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();

    EXPECT_FALSE(IsValidCoordinate(Coordinate(90.0001, 0.0)));
    EXPECT_FALSE(IsValidCoordinate(Coordinate(0.0, -180.0001)));
    EXPECT_FALSE(IsValidCoordinate(Coordinate(nan, 0.0)));
    EXPECT_FALSE(IsValidCoordinate(Coordinate(0.0, inf)));
}

TEST(GeoDistanceTest, ValidateThrowsInvalidCoordinate) {
    EXPECT_THROW(ValidateCoordinate(Coordinate(91.0, 0.0)), InvalidCoordinateError);
    EXPECT_NO_THROW(ValidateCoordinate(kNewYork));
}

TEST(GeoDistanceTest, InvalidCoordinateErrorCarriesCoordinate) {
    try {
        ValidateCoordinate(Coordinate(0.0, 200.0));
        FAIL() << "expected InvalidCoordinateError";
    } catch (const InvalidCoordinateError& e) {
        EXPECT_EQ(200.0, e.coordinate().longitude);
    }
}

// ============================================================================
// Haversine Tests
// ============================================================================

TEST(GeoDistanceTest, DistanceToSelfIsZero) {
    EXPECT_EQ(0.0, HaversineDistanceKm(kNewYork, kNewYork));
}

TEST(GeoDistanceTest, DistanceIsSymmetric) {
    EXPECT_DOUBLE_EQ(HaversineDistanceKm(kNewYork, kLosAngeles),
                     HaversineDistanceKm(kLosAngeles, kNewYork));
}

TEST(GeoDistanceTest, NewYorkToLosAngeles) {
    EXPECT_NEAR(3935.7, HaversineDistanceKm(kNewYork, kLosAngeles), 2.0);
}

TEST(GeoDistanceTest, OneDegreeOfLatitude) {
    EXPECT_NEAR(kKmPerDegree, HaversineDistanceKm(Coordinate(0.0, 0.0), Coordinate(1.0, 0.0)),
                1e-9);
}

TEST(GeoDistanceTest, AntipodalPointsAreHalfCircumference) {
    const double half = 3.14159265358979323846 * kEarthRadiusKm;
    EXPECT_NEAR(half, HaversineDistanceKm(Coordinate(0.0, 0.0), Coordinate(0.0, 180.0)), 1e-6);
}

TEST(GeoDistanceTest, AcrossAntimeridianIsShort) {
    double d = HaversineDistanceKm(Coordinate(0.0, 179.9), Coordinate(0.0, -179.9));
    EXPECT_NEAR(0.2 * kKmPerDegree, d, 1e-6);
}

TEST(GeoDistanceTest, InvalidInputThrows) {
    EXPECT_THROW(HaversineDistanceKm(Coordinate(100.0, 0.0), kNewYork), InvalidCoordinateError);
    EXPECT_THROW(HaversineDistanceKm(kNewYork, Coordinate(0.0, -181.0)), InvalidCoordinateError);
}

TEST(GeoDistanceTest, DegreeConversions) {
    EXPECT_DOUBLE_EQ(1.0, KmToDegrees(kKmPerDegree));
    EXPECT_DOUBLE_EQ(kKmPerDegree * 2.0, DegreesToKm(2.0));
    EXPECT_NEAR(111.19, DegreesToKm(1.0), 0.01);
}

// ============================================================================
// Bounding Box Tests
// ============================================================================

TEST(BoundingBoxTest, ContainsCircle) {
    const double radius = 50.0;
    BoundingBox box = ComputeBoundingBox(kNewYork, radius);

    EXPECT_FALSE(box.WrapsAntimeridian());
    EXPECT_FALSE(box.CoversAllLongitudes());
    EXPECT_TRUE(box.Contains(kNewYork));

    // Points on the circle due north, south, east and west
    double dlat = KmToDegrees(radius);
    EXPECT_TRUE(box.Contains(Coordinate(kNewYork.latitude + dlat, kNewYork.longitude)));
    EXPECT_TRUE(box.Contains(Coordinate(kNewYork.latitude - dlat, kNewYork.longitude)));

    double dlon = dlat / std::cos(kNewYork.latitude * 3.14159265358979323846 / 180.0);
    EXPECT_TRUE(box.Contains(Coordinate(kNewYork.latitude, kNewYork.longitude + dlon * 0.999)));
    EXPECT_TRUE(box.Contains(Coordinate(kNewYork.latitude, kNewYork.longitude - dlon * 0.999)));

    EXPECT_FALSE(box.Contains(kLosAngeles));
}

TEST(BoundingBoxTest, ZeroRadiusIsThePoint) {
    BoundingBox box = ComputeBoundingBox(kNewYork, 0.0);

    EXPECT_TRUE(box.Contains(kNewYork));
    EXPECT_FALSE(box.Contains(Coordinate(kNewYork.latitude + 1e-6, kNewYork.longitude)));
}

TEST(BoundingBoxTest, WrapsAtAntimeridian) {
    BoundingBox box = ComputeBoundingBox(Coordinate(0.0, 179.9), 50.0);

    EXPECT_TRUE(box.WrapsAntimeridian());
    EXPECT_TRUE(box.Contains(Coordinate(0.0, -179.9)));
    EXPECT_TRUE(box.Contains(Coordinate(0.0, 179.95)));
    EXPECT_FALSE(box.Contains(Coordinate(0.0, 0.0)));
}

TEST(BoundingBoxTest, PoleCoversAllLongitudes) {
    BoundingBox box = ComputeBoundingBox(Coordinate(89.9, 10.0), 50.0);

    EXPECT_TRUE(box.CoversAllLongitudes());
    EXPECT_DOUBLE_EQ(90.0, box.max_latitude);
    EXPECT_TRUE(box.Contains(Coordinate(89.95, -170.0)));
}

TEST(BoundingBoxTest, HugeRadiusCoversWorld) {
    BoundingBox box = ComputeBoundingBox(Coordinate(0.0, 0.0), 25000.0);

    EXPECT_TRUE(box.CoversAllLongitudes());
    EXPECT_DOUBLE_EQ(-90.0, box.min_latitude);
    EXPECT_DOUBLE_EQ(90.0, box.max_latitude);
}

TEST(BoundingBoxTest, InvalidCenterThrows) {
    EXPECT_THROW(ComputeBoundingBox(Coordinate(-91.0, 0.0), 10.0), InvalidCoordinateError);
}

} // namespace
} // namespace apo
