#include "sphere.hpp"
#include "renderer/material/material.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace prism {
namespace scene {

namespace {
inline bool isWithin(double value, double min, double max) {
    return value > min && value < max;
}
}

Sphere::Sphere(const Vec3& center, double radius, std::shared_ptr<const Material> material)
    : Shape(ShapeType::SPHERE), m_center(center), m_radius(radius), m_material(std::move(material)) {
    if (!math::isFinite(center)) {
        throw std::invalid_argument("Sphere: center must be finite");
    }
    if (!math::isFinite(radius) || radius <= 0.0) {
        throw std::invalid_argument("Sphere: radius must be positive, got " + std::to_string(radius));
    }
    if (!m_material) {
        throw std::invalid_argument("Sphere: material must not be null");
    }
}

std::optional<HitRecord> Sphere::isHit(const Ray& ray, double tMin, double tMax) const {
    Vec3 oc = ray.origin - m_center;

    // Quadratic a*t^2 + 2*halfB*t + c = 0
    double a = math::lengthSquared(ray.direction);
    if (a <= 0.0) {
        return std::nullopt;
    }
    double halfB = glm::dot(oc, ray.direction);
    double c = math::lengthSquared(oc) - m_radius * m_radius;

    double discriminant = halfB * halfB - a * c;
    if (discriminant < 0.0) {
        return std::nullopt;
    }

    double sqrtDisc = std::sqrt(discriminant);

    // Nearer root first, then the farther one
    double root = (-halfB - sqrtDisc) / a;
    if (!isWithin(root, tMin, tMax)) {
        root = (-halfB + sqrtDisc) / a;
        if (!isWithin(root, tMin, tMax)) {
            return std::nullopt;
        }
    }

    HitRecord hit;
    hit.distance = root;
    hit.point = ray.pointAt(root);
    hit.material = m_material.get();

    Vec3 outwardNormal = (hit.point - m_center) / m_radius;
    hit.isNormalOutward = glm::dot(ray.direction, outwardNormal) < 0.0;
    hit.normal = hit.isNormalOutward ? outwardNormal : -outwardNormal;

    return hit;
}

} // namespace scene
} // namespace prism
