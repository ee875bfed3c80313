// File: src/geo/geo_distance.cpp
#include "geo/geo_distance.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace apo {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Widens boxes so points exactly on the radius survive rounding
constexpr double kBoxMarginDegrees = 1e-9;

inline double ToRadians(double degrees) {
    return degrees * kPi / 180.0;
}

inline double ToDegrees(double radians) {
    return radians * 180.0 / kPi;
}

} // namespace

bool IsValidCoordinate(const Coordinate& coordinate) {
    return std::isfinite(coordinate.latitude) &&
           std::isfinite(coordinate.longitude) &&
           coordinate.latitude >= -90.0 && coordinate.latitude <= 90.0 &&
           coordinate.longitude >= -180.0 && coordinate.longitude <= 180.0;
}

void ValidateCoordinate(const Coordinate& coordinate) {
    if (!IsValidCoordinate(coordinate)) {
        throw InvalidCoordinateError(coordinate);
    }
}

double HaversineDistanceKm(const Coordinate& a, const Coordinate& b) {
    ValidateCoordinate(a);
    ValidateCoordinate(b);

    if (a == b) {
        return 0.0;
    }

    double lat1 = ToRadians(a.latitude);
    double lat2 = ToRadians(b.latitude);
    double dlat = lat2 - lat1;
    double dlon = ToRadians(b.longitude - a.longitude);

    double sin_dlat = std::sin(dlat / 2.0);
    double sin_dlon = std::sin(dlon / 2.0);

    double h = sin_dlat * sin_dlat +
               std::cos(lat1) * std::cos(lat2) * sin_dlon * sin_dlon;

    // Rounding can push h marginally above 1 for antipodal points
    h = std::min(1.0, std::max(0.0, h));

    return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(h));
}

bool BoundingBox::Contains(const Coordinate& c) const {
    if (c.latitude < min_latitude || c.latitude > max_latitude) {
        return false;
    }
    if (CoversAllLongitudes()) {
        return true;
    }
    if (WrapsAntimeridian()) {
        return c.longitude >= min_longitude || c.longitude <= max_longitude;
    }
    return c.longitude >= min_longitude && c.longitude <= max_longitude;
}

BoundingBox ComputeBoundingBox(const Coordinate& center, double radius_km) {
    ValidateCoordinate(center);

    BoundingBox box;
    if (!(radius_km > 0.0)) {
        box.min_latitude = box.max_latitude = center.latitude;
        box.min_longitude = box.max_longitude = center.longitude;
        return box;
    }

    double angular = radius_km / kEarthRadiusKm;
    double delta_lat = ToDegrees(angular) + kBoxMarginDegrees;

    box.min_latitude = center.latitude - delta_lat;
    box.max_latitude = center.latitude + delta_lat;

    // A circle that reaches a pole covers every longitude
    if (box.min_latitude <= -90.0 || box.max_latitude >= 90.0 || angular >= kPi / 2.0) {
        box.min_latitude = std::max(box.min_latitude, -90.0);
        box.max_latitude = std::min(box.max_latitude, 90.0);
        box.min_longitude = -180.0;
        box.max_longitude = 180.0;
        return box;
    }

    // Widest longitude offset of the circle (reached at the tangent latitude)
    double ratio = std::sin(angular) / std::cos(ToRadians(center.latitude));
    if (ratio >= 1.0) {
        box.min_longitude = -180.0;
        box.max_longitude = 180.0;
        return box;
    }
    double delta_lon = ToDegrees(std::asin(ratio)) + kBoxMarginDegrees;

    box.min_longitude = center.longitude - delta_lon;
    box.max_longitude = center.longitude + delta_lon;

    if (box.min_longitude < -180.0) {
        box.min_longitude += 360.0;
    }
    if (box.max_longitude > 180.0) {
        box.max_longitude -= 360.0;
    }
    return box;
}

} // namespace apo
