#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace utility
{

constexpr float kPi = 3.14159265358979323846f;
constexpr float kDegToRad = kPi / 180.0f;
constexpr float kRadToDeg = 180.0f / kPi;

template <typename T>
constexpr T squared(T value)
{
    return value * value;
}

template <typename T>
constexpr T degreesToRadians(T degrees)
{
    return degrees * static_cast<T>(kDegToRad);
}

template <typename T>
constexpr T radiansToDegrees(T radians)
{
    return radians * static_cast<T>(kRadToDeg);
}

template <typename T>
constexpr T clamp(T value, T minValue, T maxValue)
{
    return std::min(maxValue, std::max(minValue, value));
}

template <typename T>
constexpr T lerp(T from, T to, T t)
{
    return from + (to - from) * t;
}

// 6t^5 - 15t^4 + 10t^3, input clamped to [0, 1].
inline float smootherstep(float t)
{
    t = clamp(t, 0.0f, 1.0f);
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

inline float easeInOutCubic(float t)
{
    t = clamp(t, 0.0f, 1.0f);
    if (t < 0.5f)
    {
        return 4.0f * t * t * t;
    }
    const float inv = -2.0f * t + 2.0f;
    return 1.0f - (inv * inv * inv) * 0.5f;
}

// Wraps into [-180, 180). +180 maps to -180.
inline double wrapLongitude(double degrees)
{
    double wrapped = std::fmod(degrees + 180.0, 360.0);
    if (wrapped < 0.0)
    {
        wrapped += 360.0;
    }
    return wrapped - 180.0;
}

} // namespace utility
