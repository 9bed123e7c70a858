#include "dielectric_material.hpp"
#include "core/random/random_source.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace prism {

DielectricMaterial::DielectricMaterial(double index, std::string name)
    : Material(Type::Dielectric, std::move(name)), refractiveIndex(index) {
    if (!math::isFinite(refractiveIndex) || refractiveIndex <= 0.0) {
        throw std::invalid_argument("DielectricMaterial: refractive index must be positive");
    }
}

double DielectricMaterial::reflectance(double cosine, double ratio) {
    double r0 = (1.0 - ratio) / (1.0 + ratio);
    r0 = r0 * r0;
    return r0 + (1.0 - r0) * std::pow(1.0 - cosine, 5.0);
}

ScatterResult DielectricMaterial::scatter(const Ray& incoming, const HitRecord& hit, RandomSource& rng) const {
    // Entering the medium divides by its index, leaving multiplies
    double ratio = hit.isNormalOutward ? (1.0 / refractiveIndex) : refractiveIndex;

    Vec3 unitDir = math::direction(incoming.direction);
    double cosTheta = std::min(glm::dot(-unitDir, hit.normal), 1.0);
    double sinTheta = std::sqrt(std::max(0.0, 1.0 - cosTheta * cosTheta));

    bool cannotRefract = ratio * sinTheta > 1.0;

    Vec3 scatterDir;
    if (cannotRefract) {
        scatterDir = math::reflect(unitDir, hit.normal);
    } else if (ratio == 1.0) {
        // Index-matched boundary: nothing to reflect off
        scatterDir = math::refract(unitDir, hit.normal, ratio);
    } else if (rng.uniform() < reflectance(cosTheta, ratio)) {
        scatterDir = math::reflect(unitDir, hit.normal);
    } else {
        scatterDir = math::refract(unitDir, hit.normal, ratio);
    }

    ScatterResult result;
    result.scattered = Ray(hit.point, math::direction(scatterDir));
    result.attenuation = Color(1.0);
    result.didScatter = true;
    return result;
}

} // namespace prism
