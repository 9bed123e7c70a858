#include "matte_material.hpp"
#include "core/random/random_source.hpp"
#include <stdexcept>

namespace prism {

MatteMaterial::MatteMaterial(const Color& albedoColor, std::string name)
    : Material(Type::Matte, std::move(name)), albedo(albedoColor) {
    if (!math::isFinite(albedo) || albedo.x < 0.0 || albedo.y < 0.0 || albedo.z < 0.0) {
        throw std::invalid_argument("MatteMaterial: albedo must be finite and non-negative");
    }
}

ScatterResult MatteMaterial::scatter(const Ray& /*incoming*/, const HitRecord& hit, RandomSource& rng) const {
    // Normal plus a uniform unit vector gives a cosine-weighted direction
    Vec3 scatterDir = hit.normal + rng.unitVector();

    // Catch degenerate scatter direction
    if (math::isNearZero(scatterDir)) {
        scatterDir = hit.normal;
    }

    ScatterResult result;
    result.scattered = Ray(hit.point, math::direction(scatterDir));
    result.attenuation = albedo;
    result.didScatter = true;
    return result;
}

} // namespace prism
