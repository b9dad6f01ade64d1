#pragma once

#include <string>

#include <glm/vec2.hpp>

namespace engine::geo
{
constexpr double kEarthRadiusMeters = 6371000.0;
constexpr double kMetersPerDegreeLatitude = 111320.0;

/// WGS-84 latitude/longitude in degrees.
struct GeoPoint
{
    double latitude = 0.0;
    double longitude = 0.0;
};

enum class CompassPoints
{
    Eight,
    Sixteen
};

/// Finite, latitude in [-90, 90], longitude in [-180, 180].
[[nodiscard]] bool IsValidCoordinate(const GeoPoint& point);

/// Great-circle (haversine) distance in meters. Exactly 0 for identical points.
[[nodiscard]] double DistanceMeters(const GeoPoint& a, const GeoPoint& b);

/// Initial bearing from `from` to `to` in [0, 360), 0 = north, 90 = east.
/// Identical points are degenerate and return 0.
[[nodiscard]] double BearingDegrees(const GeoPoint& from, const GeoPoint& to);

/// Signed turn from device heading to target bearing, wrapped to [-180, 180).
/// RelativeBearing(350, 10) == -20.
[[nodiscard]] double RelativeBearing(double targetBearing, double deviceHeading);

/// Normalizes any angle into [0, 360).
[[nodiscard]] double NormalizeDegrees(double degrees);

/// Compass label with midpoint rounding; sector boundaries belong to the upper label
/// (22.5 is "NE" with eight points).
[[nodiscard]] const char* CardinalDirection(double bearing, CompassPoints points = CompassPoints::Eight);
[[nodiscard]] const char* CardinalDirectionFull(double bearing);

/// "850m" below one kilometer, "1.2km" above.
[[nodiscard]] std::string FormatDistance(double meters);
/// "123° SE"; "--" for a non-finite bearing.
[[nodiscard]] std::string FormatBearing(double bearing);
/// "12.3456N, 45.6789W"
[[nodiscard]] std::string FormatCoordinates(const GeoPoint& point, int decimals = 4);

/// Flat-earth offset, good for the few hundred meters a hunt spans.
[[nodiscard]] GeoPoint OffsetPosition(const GeoPoint& origin, double metersNorth, double metersEast);

/// Target position relative to origin in meters: x = east, y = north.
[[nodiscard]] glm::dvec2 LocalOffsetMeters(const GeoPoint& origin, const GeoPoint& target);
} // namespace engine::geo
