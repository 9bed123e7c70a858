#pragma once

#include "shape.hpp"

namespace prism {

class Material;

namespace scene {

class Sphere : public Shape {
public:
    // Throws std::invalid_argument for a non-positive radius or null material
    Sphere(const Vec3& center, double radius, std::shared_ptr<const Material> material);
    ~Sphere() override = default;

    // Accessors
    const Vec3& getCenter() const { return m_center; }
    double getRadius() const { return m_radius; }
    const std::shared_ptr<const Material>& getMaterial() const { return m_material; }

    // Shape interface
    [[nodiscard]] std::optional<HitRecord> isHit(const Ray& ray, double tMin, double tMax) const override;

private:
    Vec3 m_center{0.0};
    double m_radius{1.0};
    std::shared_ptr<const Material> m_material;
};

} // namespace scene
} // namespace prism
