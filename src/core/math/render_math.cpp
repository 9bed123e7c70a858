#include "render_math.hpp"
#include <algorithm>

namespace prism {
namespace math {

Vec3 refract(const Vec3& d, const Vec3& n, double ratio) {
    Vec3 unitDir = direction(d);
    double cosTheta = std::min(glm::dot(-unitDir, n), 1.0);

    // Components perpendicular and parallel to the normal
    Vec3 perpendicular = ratio * (unitDir + cosTheta * n);
    Vec3 parallel = -std::sqrt(std::abs(1.0 - lengthSquared(perpendicular))) * n;

    return perpendicular + parallel;
}

double angleBetween(const Vec3& a, const Vec3& b) {
    double denom = length(a) * length(b);
    if (denom <= 0.0) {
        return 0.0;
    }
    double cosine = clamp(glm::dot(a, b) / denom, -1.0, 1.0);
    return std::acos(cosine);
}

} // namespace math
} // namespace prism
