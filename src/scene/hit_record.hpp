#pragma once
#include "core/math/render_math.hpp"

namespace prism {

class Material;

// Result of a successful ray/shape intersection. Only lives for the duration
// of one bounce.
struct HitRecord {
    Vec3 point{0.0};
    double distance{0.0};

    // Unit normal, always facing against the incoming ray
    Vec3 normal{0.0, 1.0, 0.0};

    // True when the geometric outward normal already faced the ray,
    // i.e. the ray arrived from outside the shape
    bool isNormalOutward{true};

    const Material* material{nullptr};
};

} // namespace prism
