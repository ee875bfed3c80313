// File: src/geo/geo_distance.hpp
#pragma once

#include "core/types.hpp"

namespace apo {

/// Mean Earth radius used by all great-circle computations
constexpr double kEarthRadiusKm = 6371.0;

/// Length of one degree of latitude on the mean-radius sphere
constexpr double kKmPerDegree = 111.19492664455873;

/// Check that latitude is in [-90, 90], longitude in [-180, 180], both finite
bool IsValidCoordinate(const Coordinate& coordinate);

/// Throw InvalidCoordinateError unless IsValidCoordinate(coordinate)
void ValidateCoordinate(const Coordinate& coordinate);

/// Great-circle distance between two coordinates (haversine formula)
///
/// Pure and deterministic: HaversineDistanceKm(a, a) == 0 and
/// HaversineDistanceKm(a, b) == HaversineDistanceKm(b, a).
/// @throws InvalidCoordinateError if either input is out of range
double HaversineDistanceKm(const Coordinate& a, const Coordinate& b);

/// Convert a north-south distance in kilometres to degrees of latitude
inline double KmToDegrees(double km) { return km / kKmPerDegree; }

/// Convert degrees of latitude to kilometres
inline double DegreesToKm(double degrees) { return degrees * kKmPerDegree; }

/// Latitude/longitude box enclosing every point within a radius of a center
///
/// When the circle crosses the antimeridian min_longitude > max_longitude
/// (the box wraps). When it reaches a pole the box spans all longitudes.
struct BoundingBox {
    double min_latitude{-90.0};
    double max_latitude{90.0};
    double min_longitude{-180.0};
    double max_longitude{180.0};

    /// True if the longitude range wraps across +/-180
    bool WrapsAntimeridian() const { return min_longitude > max_longitude; }

    /// True if the box covers every longitude
    bool CoversAllLongitudes() const {
        return min_longitude <= -180.0 && max_longitude >= 180.0;
    }

    bool Contains(const Coordinate& c) const;
};

/// Compute the bounding box of the radius circle around center
/// @throws InvalidCoordinateError if center is out of range
BoundingBox ComputeBoundingBox(const Coordinate& center, double radius_km);

} // namespace apo
