#include "engine/geo/GeoMath.hpp"

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

namespace engine::geo::test
{
namespace
{
constexpr double kOneDegreeMeters = kEarthRadiusMeters * 3.14159265358979323846 / 180.0;
}

TEST(GeoMath, DistanceToSelfIsExactlyZero)
{
    const GeoPoint p{51.5074, -0.1278};
    EXPECT_EQ(DistanceMeters(p, p), 0.0);
}

TEST(GeoMath, DistanceIsSymmetric)
{
    const GeoPoint a{40.7128, -74.0060};
    const GeoPoint b{40.7138, -74.0021};
    EXPECT_DOUBLE_EQ(DistanceMeters(a, b), DistanceMeters(b, a));
}

TEST(GeoMath, DistanceAlongEquator)
{
    EXPECT_NEAR(DistanceMeters({0.0, 0.0}, {0.0, 1.0}), kOneDegreeMeters, 1.0e-6);
    EXPECT_NEAR(DistanceMeters({0.0, 0.0}, {0.0, 0.00005}), 5.5598, 1.0e-3);
    EXPECT_NEAR(DistanceMeters({0.0, 0.0}, {0.0, 0.00004}), 4.4479, 1.0e-3);
}

TEST(GeoMath, DistanceKeepsSubMeterResolution)
{
    const GeoPoint origin{48.8566, 2.3522};
    const GeoPoint tenCm = OffsetPosition(origin, 0.1, 0.0);
    const double d = DistanceMeters(origin, tenCm);
    EXPECT_GT(d, 0.05);
    EXPECT_LT(d, 0.15);
}

TEST(GeoMath, DistanceAcrossAntimeridian)
{
    EXPECT_NEAR(DistanceMeters({0.0, 179.9999}, {0.0, -179.9999}), 0.0002 * kOneDegreeMeters, 1.0e-3);
}

TEST(GeoMath, NearAntipodalDistanceIsFinite)
{
    const double d = DistanceMeters({0.0, 0.0}, {0.0, 180.0});
    EXPECT_TRUE(std::isfinite(d));
    EXPECT_NEAR(d, kEarthRadiusMeters * 3.14159265358979323846, 1.0);
}

TEST(GeoMath, BearingToCardinalNeighbours)
{
    const GeoPoint origin{0.0, 0.0};
    EXPECT_NEAR(BearingDegrees(origin, {1.0, 0.0}), 0.0, 1.0e-9);
    EXPECT_NEAR(BearingDegrees(origin, {0.0, 1.0}), 90.0, 1.0e-9);
    EXPECT_NEAR(BearingDegrees(origin, {-1.0, 0.0}), 180.0, 1.0e-9);
    EXPECT_NEAR(BearingDegrees(origin, {0.0, -1.0}), 270.0, 1.0e-9);
}

TEST(GeoMath, BearingBetweenIdenticalPointsIsZero)
{
    const GeoPoint p{12.0, 34.0};
    EXPECT_EQ(BearingDegrees(p, p), 0.0);
}

TEST(GeoMath, BearingStaysInRange)
{
    for (double lon = -3.0; lon <= 3.0; lon += 0.25)
    {
        for (double lat = -3.0; lat <= 3.0; lat += 0.25)
        {
            const double b = BearingDegrees({0.5, 0.5}, {lat, lon});
            EXPECT_GE(b, 0.0);
            EXPECT_LT(b, 360.0);
        }
    }
}

TEST(GeoMath, RelativeBearingTakesTheShortTurn)
{
    EXPECT_DOUBLE_EQ(RelativeBearing(350.0, 10.0), -20.0);
    EXPECT_DOUBLE_EQ(RelativeBearing(10.0, 350.0), 20.0);
    EXPECT_NEAR(RelativeBearing(359.0, 1.0), -2.0, 1.0e-9);
    EXPECT_DOUBLE_EQ(RelativeBearing(90.0, 90.0), 0.0);
    EXPECT_DOUBLE_EQ(RelativeBearing(180.0, 0.0), -180.0);
}

TEST(GeoMath, NormalizeDegreesWrapsIntoHalfOpenRange)
{
    EXPECT_DOUBLE_EQ(NormalizeDegrees(360.0), 0.0);
    EXPECT_DOUBLE_EQ(NormalizeDegrees(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(NormalizeDegrees(725.0), 5.0);
    EXPECT_LT(NormalizeDegrees(-1.0e-15), 360.0);
}

TEST(GeoMath, CardinalBoundariesRoundToUpperSector)
{
    EXPECT_STREQ(CardinalDirection(0.0), "N");
    EXPECT_STREQ(CardinalDirection(22.4), "N");
    EXPECT_STREQ(CardinalDirection(22.5), "NE");
    EXPECT_STREQ(CardinalDirection(67.5), "E");
    EXPECT_STREQ(CardinalDirection(337.4), "NW");
    EXPECT_STREQ(CardinalDirection(337.5), "N");
    EXPECT_STREQ(CardinalDirection(-45.0), "NW");
    EXPECT_STREQ(CardinalDirection(11.25, CompassPoints::Sixteen), "NNE");
    EXPECT_STREQ(CardinalDirectionFull(180.0), "South");
}

TEST(GeoMath, NonFiniteBearingHasNoDirection)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_STREQ(CardinalDirection(nan), "--");
    EXPECT_STREQ(CardinalDirection(inf, CompassPoints::Sixteen), "--");
    EXPECT_STREQ(CardinalDirectionFull(-inf), "--");
    EXPECT_EQ(FormatBearing(nan), "--");
}

TEST(GeoMath, FormatDistanceSwitchesToKilometers)
{
    EXPECT_EQ(FormatDistance(4.4), "4m");
    EXPECT_EQ(FormatDistance(999.4), "999m");
    EXPECT_EQ(FormatDistance(999.5), "1.0km");
    EXPECT_EQ(FormatDistance(1234.0), "1.2km");
    EXPECT_EQ(FormatDistance(std::numeric_limits<double>::quiet_NaN()), "--");
}

TEST(GeoMath, FormatBearingAndCoordinates)
{
    EXPECT_EQ(FormatBearing(123.4), "123\xC2\xB0 SE");
    EXPECT_EQ(FormatBearing(359.8), "0\xC2\xB0 N");
    EXPECT_EQ(FormatCoordinates({12.3456, -45.6789}), "12.3456N, 45.6789W");
    EXPECT_EQ(FormatCoordinates({-1.5, 2.25}, 2), "1.50S, 2.25E");
}

TEST(GeoMath, CoordinateValidation)
{
    EXPECT_TRUE(IsValidCoordinate({0.0, 0.0}));
    EXPECT_TRUE(IsValidCoordinate({90.0, -180.0}));
    EXPECT_FALSE(IsValidCoordinate({90.0001, 0.0}));
    EXPECT_FALSE(IsValidCoordinate({0.0, 180.5}));
    EXPECT_FALSE(IsValidCoordinate({std::numeric_limits<double>::quiet_NaN(), 0.0}));
    EXPECT_FALSE(IsValidCoordinate({0.0, std::numeric_limits<double>::infinity()}));
}

TEST(GeoMath, OffsetAndLocalOffsetAgree)
{
    const GeoPoint origin{0.0, 0.0};
    EXPECT_NEAR(DistanceMeters(origin, OffsetPosition(origin, 100.0, 0.0)), 100.0, 0.5);

    const glm::dvec2 east = LocalOffsetMeters(origin, {0.0, 0.0001});
    EXPECT_NEAR(east.x, 0.0001 * kOneDegreeMeters, 1.0e-6);
    EXPECT_NEAR(east.y, 0.0, 1.0e-6);
}
} // namespace engine::geo::test
