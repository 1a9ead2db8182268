#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <cmath>

// Physics-space coordinates are 2D, double precision, in meters.
using PhysicsVec2 = glm::dvec2;

// Scene-space coordinates are what the renderer consumes (display units).
using SceneVec3 = glm::vec3;

inline double magnitude(const PhysicsVec2 &v)
{
    return std::sqrt(v.x * v.x + v.y * v.y);
}

inline bool is_finite(const PhysicsVec2 &v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

inline bool is_zero(const PhysicsVec2 &v)
{
    return v.x == 0.0 && v.y == 0.0;
}
