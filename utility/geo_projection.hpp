#pragma once

#include <glm/glm.hpp>

namespace utility
{

// Radius of the globe surface, and of the shell the markers sit on.
constexpr float kGlobeRadius = 2.0f;
constexpr float kMarkerShellRadius = 2.05f;

// Spherical to Cartesian with +Y through the north pole. Latitude is clamped
// to [-90, 90], longitude wraps at +-180, and non-finite input is read as 0,
// so the result is always finite.
glm::vec3 latLonToSphere(double latitude_deg, double longitude_deg, float radius);

// Equirectangular texture coordinates in [0, 1]: u grows eastward from -180,
// v grows southward from +90.
glm::vec2 latLonToEquirect(double latitude_deg, double longitude_deg);

} // namespace utility
