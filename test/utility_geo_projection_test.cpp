#include "utility/geo_projection.hpp"

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

namespace
{
bool isFinite(const glm::vec3& v)
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}
} // namespace

TEST(GeoProjectionTest, PolesMapToYAxis)
{
    const glm::vec3 north = utility::latLonToSphere(90.0, 0.0, 2.0f);
    EXPECT_NEAR(north.x, 0.0f, 1e-5f);
    EXPECT_NEAR(north.y, 2.0f, 1e-5f);
    EXPECT_NEAR(north.z, 0.0f, 1e-5f);

    const glm::vec3 south = utility::latLonToSphere(-90.0, 123.0, 2.0f);
    EXPECT_NEAR(south.y, -2.0f, 1e-5f);
    EXPECT_NEAR(std::hypot(south.x, south.z), 0.0f, 1e-5f);
}

TEST(GeoProjectionTest, EquatorOrientation)
{
    // lon 0 faces +X, lon 90 faces -Z with this convention.
    const glm::vec3 prime = utility::latLonToSphere(0.0, 0.0, 1.0f);
    EXPECT_NEAR(prime.x, 1.0f, 1e-5f);
    EXPECT_NEAR(prime.y, 0.0f, 1e-5f);
    EXPECT_NEAR(prime.z, 0.0f, 1e-5f);

    const glm::vec3 east = utility::latLonToSphere(0.0, 90.0, 1.0f);
    EXPECT_NEAR(east.x, 0.0f, 1e-5f);
    EXPECT_NEAR(east.z, -1.0f, 1e-5f);
}

TEST(GeoProjectionTest, PointsLieOnRequestedRadius)
{
    for (double lat = -90.0; lat <= 90.0; lat += 15.0)
    {
        for (double lon = -180.0; lon <= 180.0; lon += 30.0)
        {
            const glm::vec3 p = utility::latLonToSphere(lat, lon, 2.05f);
            EXPECT_NEAR(glm::length(p), 2.05f, 1e-4f);
        }
    }
}

TEST(GeoProjectionTest, ClampsWrapsAndRejectsNonFinite)
{
    const glm::vec3 over = utility::latLonToSphere(120.0, 0.0, 2.0f);
    const glm::vec3 pole = utility::latLonToSphere(90.0, 0.0, 2.0f);
    EXPECT_NEAR(glm::length(over - pole), 0.0f, 1e-5f);

    const glm::vec3 wrapped = utility::latLonToSphere(10.0, 370.0, 2.0f);
    const glm::vec3 direct = utility::latLonToSphere(10.0, 10.0, 2.0f);
    EXPECT_NEAR(glm::length(wrapped - direct), 0.0f, 1e-4f);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    const glm::vec3 bad = utility::latLonToSphere(nan, inf, 2.0f);
    EXPECT_TRUE(isFinite(bad));
    EXPECT_NEAR(glm::length(bad - utility::latLonToSphere(0.0, 0.0, 2.0f)), 0.0f, 1e-5f);
}

TEST(GeoProjectionTest, EquirectangularCoordinates)
{
    const glm::vec2 origin = utility::latLonToEquirect(90.0, -180.0);
    EXPECT_FLOAT_EQ(origin.x, 0.0f);
    EXPECT_FLOAT_EQ(origin.y, 0.0f);

    const glm::vec2 center = utility::latLonToEquirect(0.0, 0.0);
    EXPECT_FLOAT_EQ(center.x, 0.5f);
    EXPECT_FLOAT_EQ(center.y, 0.5f);

    const glm::vec2 corner = utility::latLonToEquirect(-90.0, 180.0);
    EXPECT_FLOAT_EQ(corner.x, 1.0f);
    EXPECT_FLOAT_EQ(corner.y, 1.0f);
}
