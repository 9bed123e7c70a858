#include "shape_group.hpp"
#include <stdexcept>

namespace prism {
namespace scene {

ShapeGroup::ShapeGroup(std::vector<Shape::Ptr> shapes)
    : Shape(ShapeType::GROUP) {
    m_shapes.reserve(shapes.size());
    for (auto& shape : shapes) {
        add(std::move(shape));
    }
}

void ShapeGroup::add(Shape::Ptr shape) {
    if (!shape) {
        throw std::invalid_argument("ShapeGroup: cannot add a null shape");
    }
    m_shapes.push_back(std::move(shape));
}

std::optional<HitRecord> ShapeGroup::isHit(const Ray& ray, double tMin, double tMax) const {
    std::optional<HitRecord> closest;
    double closestSoFar = tMax;

    // Shrinking tMax rejects anything behind the current best
    for (const auto& shape : m_shapes) {
        if (auto hit = shape->isHit(ray, tMin, closestSoFar)) {
            closestSoFar = hit->distance;
            closest = hit;
        }
    }

    return closest;
}

} // namespace scene
} // namespace prism
