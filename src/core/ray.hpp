#pragma once
#include "core/math/render_math.hpp"

namespace prism {

struct Ray {
    Vec3 origin{0.0};
    Vec3 direction{0.0, 0.0, -1.0};  // Not necessarily unit length

    Ray() = default;
    Ray(const Vec3& orig, const Vec3& dir)
        : origin(orig), direction(dir) {}

    // Get point along ray at parameter t
    Vec3 pointAt(double t) const {
        return origin + direction * t;
    }
};

} // namespace prism
