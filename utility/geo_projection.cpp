#include "utility/geo_projection.hpp"

#include <cmath>

#include "utility/math_utils.hpp"

namespace utility
{
namespace
{
double finiteOrZero(double value)
{
    return std::isfinite(value) ? value : 0.0;
}
} // namespace

glm::vec3 latLonToSphere(double latitude_deg, double longitude_deg, float radius)
{
    const double latitude = clamp(finiteOrZero(latitude_deg), -90.0, 90.0);
    const double longitude = wrapLongitude(finiteOrZero(longitude_deg));
    const double r = std::isfinite(radius) ? static_cast<double>(radius) : 0.0;

    const double phi = degreesToRadians(90.0 - latitude);
    const double theta = degreesToRadians(longitude + 180.0);

    const double sinPhi = std::sin(phi);
    const double x = -(r * sinPhi * std::cos(theta));
    const double y = r * std::cos(phi);
    const double z = r * sinPhi * std::sin(theta);
    return glm::vec3(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z));
}

glm::vec2 latLonToEquirect(double latitude_deg, double longitude_deg)
{
    const double latitude = clamp(finiteOrZero(latitude_deg), -90.0, 90.0);
    const double longitude = clamp(finiteOrZero(longitude_deg), -180.0, 180.0);
    return glm::vec2(static_cast<float>((longitude + 180.0) / 360.0), static_cast<float>((90.0 - latitude) / 180.0));
}

} // namespace utility
