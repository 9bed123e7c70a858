#include "metallic_material.hpp"
#include "core/random/random_source.hpp"
#include <stdexcept>

namespace prism {

MetallicMaterial::MetallicMaterial(const Color& albedoColor, double fuzzAmount, std::string name)
    : Material(Type::Metallic, std::move(name)), albedo(albedoColor), fuzz(fuzzAmount) {
    if (!math::isFinite(albedo) || albedo.x < 0.0 || albedo.y < 0.0 || albedo.z < 0.0) {
        throw std::invalid_argument("MetallicMaterial: albedo must be finite and non-negative");
    }
    if (!math::isFinite(fuzz) || fuzz < 0.0 || fuzz > 1.0) {
        throw std::invalid_argument("MetallicMaterial: fuzz must be in [0, 1]");
    }
}

ScatterResult MetallicMaterial::scatter(const Ray& incoming, const HitRecord& hit, RandomSource& rng) const {
    Vec3 reflected = math::direction(math::reflect(incoming.direction, hit.normal));

    Vec3 scatterDir = reflected;
    if (fuzz > 0.0) {
        scatterDir = math::direction(reflected + fuzz * rng.vectorInUnitSphere());
    }

    ScatterResult result;
    result.scattered = Ray(hit.point, scatterDir);
    result.attenuation = albedo;
    // Fuzz can push the ray below the surface; that counts as absorption
    result.didScatter = glm::dot(scatterDir, hit.normal) > 0.0;
    return result;
}

} // namespace prism
