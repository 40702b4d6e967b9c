#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <cmath>

namespace lumen
{

constexpr double PI = 3.14159265358979323846;

// Geometry runs in double precision, shading in float.
using Vector3 = glm::dvec3;
using Color   = glm::vec3;

inline double lengthSquared(const Vector3& v)
{
    return glm::dot(v, v);
}

// True when every component is within 1e-8 of zero.
inline bool nearZero(const Vector3& v)
{
    constexpr double s = 1e-8;
    return std::abs(v.x) < s && std::abs(v.y) < s && std::abs(v.z) < s;
}

inline float clamp01(float v)
{
    return std::clamp(v, 0.0f, 1.0f);
}

inline Color clamp01(const Color& c)
{
    return Color(clamp01(c.r), clamp01(c.g), clamp01(c.b));
}

} // namespace lumen
