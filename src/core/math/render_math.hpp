#pragma once

#include <glm/glm.hpp>
#include <cmath>
#include <limits>

namespace prism {

// Points, directions and linear RGB colours share one representation.
using Vec3 = glm::dvec3;
using Color = glm::dvec3;

namespace math {

// === CONSTANTS ===
namespace constants {
    constexpr double PI = 3.14159265358979323846;

    // Component magnitude under which a vector counts as degenerate
    constexpr double NEAR_ZERO_EPSILON = 1e-8;

    // Lower bound of the hit interval for secondary rays (avoids self-intersection)
    constexpr double HIT_EPSILON = 1e-3;

    constexpr double INFINITE_DISTANCE = std::numeric_limits<double>::infinity();
}

// === VECTOR MATH ===
inline double lengthSquared(const Vec3& v) {
    return glm::dot(v, v);
}

inline double length(const Vec3& v) {
    return std::sqrt(lengthSquared(v));
}

// Unit vector along v. A zero-length input yields the zero vector so that
// callers can catch it with isNearZero() instead of propagating NaNs.
inline Vec3 direction(const Vec3& v) {
    double len = length(v);
    if (len > 0.0) {
        return v / len;
    }
    return Vec3(0.0);
}

// Mirror d about the unit normal n: r = d - 2(d.n)n
inline Vec3 reflect(const Vec3& d, const Vec3& n) {
    return d - 2.0 * glm::dot(d, n) * n;
}

// Snell's law refraction of d through a surface with unit normal n facing the
// incoming side. ratio is (index of the incident medium / index of the far medium).
Vec3 refract(const Vec3& d, const Vec3& n, double ratio);

// Angle in radians between two non-zero vectors
double angleBetween(const Vec3& a, const Vec3& b);

// === UTILITY FUNCTIONS ===
inline bool isNearZero(const Vec3& v, double epsilon = constants::NEAR_ZERO_EPSILON) {
    return std::abs(v.x) < epsilon && std::abs(v.y) < epsilon && std::abs(v.z) < epsilon;
}

inline bool isFinite(double value) {
    return std::isfinite(value);
}

inline bool isFinite(const Vec3& v) {
    return isFinite(v.x) && isFinite(v.y) && isFinite(v.z);
}

inline double clamp(double value, double min, double max) {
    return value < min ? min : (value > max ? max : value);
}

inline Vec3 lerp(const Vec3& a, const Vec3& b, double t) {
    return (1.0 - t) * a + t * b;
}

inline double degreesToRadians(double degrees) {
    return degrees * constants::PI / 180.0;
}

} // namespace math
} // namespace prism
