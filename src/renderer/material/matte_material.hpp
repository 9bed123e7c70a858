#pragma once
#include "material.hpp"

namespace prism {

// Lambertian diffuse surface
class MatteMaterial : public Material {
public:
    explicit MatteMaterial(const Color& albedo, std::string name = "Matte");

    ScatterResult scatter(const Ray& incoming, const HitRecord& hit, RandomSource& rng) const override;

    const Color& getAlbedo() const { return albedo; }

private:
    Color albedo;
};

} // namespace prism
