#pragma once
#include "material.hpp"

namespace prism {

// Mirror-like reflection, blurred by fuzz (0 = perfect mirror, 1 = roughest)
class MetallicMaterial : public Material {
public:
    MetallicMaterial(const Color& albedo, double fuzz, std::string name = "Metallic");

    ScatterResult scatter(const Ray& incoming, const HitRecord& hit, RandomSource& rng) const override;

    const Color& getAlbedo() const { return albedo; }
    double getFuzz() const { return fuzz; }

private:
    Color albedo;
    double fuzz;
};

} // namespace prism
