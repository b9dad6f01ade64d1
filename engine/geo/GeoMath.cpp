#include "engine/geo/GeoMath.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>

#include <glm/trigonometric.hpp>

namespace engine::geo
{
namespace
{
constexpr std::array<const char*, 8> kEightPoints{"N", "NE", "E", "SE", "S", "SW", "W", "NW"};

constexpr std::array<const char*, 16> kSixteenPoints{
    "N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
    "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"
};

constexpr std::array<const char*, 8> kEightPointNames{
    "North", "Northeast", "East", "Southeast", "South", "Southwest", "West", "Northwest"
};

std::size_t SectorIndex(double bearing, std::size_t sectors)
{
    const double step = 360.0 / static_cast<double>(sectors);
    const double shifted = NormalizeDegrees(bearing) + step * 0.5;
    return static_cast<std::size_t>(std::floor(shifted / step)) % sectors;
}
} // namespace

bool IsValidCoordinate(const GeoPoint& point)
{
    if (!std::isfinite(point.latitude) || !std::isfinite(point.longitude))
    {
        return false;
    }
    return point.latitude >= -90.0 && point.latitude <= 90.0 &&
           point.longitude >= -180.0 && point.longitude <= 180.0;
}

double DistanceMeters(const GeoPoint& a, const GeoPoint& b)
{
    const double dLat = glm::radians(b.latitude - a.latitude);
    const double dLon = glm::radians(b.longitude - a.longitude);
    const double lat1 = glm::radians(a.latitude);
    const double lat2 = glm::radians(b.latitude);

    const double sinHalfLat = std::sin(dLat * 0.5);
    const double sinHalfLon = std::sin(dLon * 0.5);

    // Clamp guards the sqrt(1 - h) term against rounding just past 1 for near-antipodal pairs.
    const double h = std::clamp(
        sinHalfLat * sinHalfLat + std::cos(lat1) * std::cos(lat2) * sinHalfLon * sinHalfLon,
        0.0,
        1.0
    );
    const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    return kEarthRadiusMeters * c;
}

double BearingDegrees(const GeoPoint& from, const GeoPoint& to)
{
    if (from.latitude == to.latitude && from.longitude == to.longitude)
    {
        return 0.0;
    }

    const double lat1 = glm::radians(from.latitude);
    const double lat2 = glm::radians(to.latitude);
    const double dLon = glm::radians(to.longitude - from.longitude);

    const double y = std::sin(dLon) * std::cos(lat2);
    const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dLon);

    return NormalizeDegrees(glm::degrees(std::atan2(y, x)));
}

double NormalizeDegrees(double degrees)
{
    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped < 0.0)
    {
        wrapped += 360.0;
    }
    // -1e-15 + 360 rounds to 360.
    if (wrapped >= 360.0)
    {
        wrapped -= 360.0;
    }
    return wrapped;
}

double RelativeBearing(double targetBearing, double deviceHeading)
{
    return NormalizeDegrees(targetBearing - deviceHeading + 180.0) - 180.0;
}

const char* CardinalDirection(double bearing, CompassPoints points)
{
    if (!std::isfinite(bearing))
    {
        return "--";
    }
    if (points == CompassPoints::Sixteen)
    {
        return kSixteenPoints[SectorIndex(bearing, kSixteenPoints.size())];
    }
    return kEightPoints[SectorIndex(bearing, kEightPoints.size())];
}

const char* CardinalDirectionFull(double bearing)
{
    if (!std::isfinite(bearing))
    {
        return "--";
    }
    return kEightPointNames[SectorIndex(bearing, kEightPointNames.size())];
}

std::string FormatDistance(double meters)
{
    if (!std::isfinite(meters) || meters < 0.0)
    {
        return "--";
    }

    char buffer[32];
    if (meters < 999.5)
    {
        std::snprintf(buffer, sizeof(buffer), "%.0fm", meters);
    }
    else
    {
        std::snprintf(buffer, sizeof(buffer), "%.1fkm", meters / 1000.0);
    }
    return buffer;
}

std::string FormatBearing(double bearing)
{
    if (!std::isfinite(bearing))
    {
        return "--";
    }

    const double normalized = NormalizeDegrees(bearing);
    double rounded = std::round(normalized);
    if (rounded >= 360.0)
    {
        rounded = 0.0;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.0f\xC2\xB0 %s", rounded, CardinalDirection(normalized));
    return buffer;
}

std::string FormatCoordinates(const GeoPoint& point, int decimals)
{
    const int precision = std::clamp(decimals, 0, 8);
    const char latHemisphere = point.latitude >= 0.0 ? 'N' : 'S';
    const char lonHemisphere = point.longitude >= 0.0 ? 'E' : 'W';

    char buffer[64];
    std::snprintf(
        buffer,
        sizeof(buffer),
        "%.*f%c, %.*f%c",
        precision,
        std::abs(point.latitude),
        latHemisphere,
        precision,
        std::abs(point.longitude),
        lonHemisphere
    );
    return buffer;
}

GeoPoint OffsetPosition(const GeoPoint& origin, double metersNorth, double metersEast)
{
    const double cosLat = std::max(1.0e-9, std::cos(glm::radians(origin.latitude)));
    GeoPoint result;
    result.latitude = origin.latitude + metersNorth / kMetersPerDegreeLatitude;
    result.longitude = origin.longitude + metersEast / (kMetersPerDegreeLatitude * cosLat);
    return result;
}

glm::dvec2 LocalOffsetMeters(const GeoPoint& origin, const GeoPoint& target)
{
    const double distance = DistanceMeters(origin, target);
    const double bearing = glm::radians(BearingDegrees(origin, target));
    return glm::dvec2{distance * std::sin(bearing), distance * std::cos(bearing)};
}
} // namespace engine::geo
