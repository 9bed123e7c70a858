#pragma once
#include "material.hpp"

namespace prism {

// Clear refractive material (glass, water, diamond). Never tints.
class DielectricMaterial : public Material {
public:
    explicit DielectricMaterial(double refractiveIndex, std::string name = "Dielectric");

    ScatterResult scatter(const Ray& incoming, const HitRecord& hit, RandomSource& rng) const override;

    double getRefractiveIndex() const { return refractiveIndex; }

    // Schlick's approximation of Fresnel reflectance
    static double reflectance(double cosine, double ratio);

private:
    double refractiveIndex;
};

} // namespace prism
