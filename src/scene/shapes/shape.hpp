#pragma once

#include "core/ray.hpp"
#include "scene/hit_record.hpp"
#include <memory>
#include <optional>

namespace prism {
namespace scene {

enum class ShapeType {
    SPHERE = 0,
    GROUP = 1
};

// Base class for everything a ray can hit
class Shape {
public:
    using Ptr = std::shared_ptr<const Shape>;

    explicit Shape(ShapeType type) : m_type(type) {}
    virtual ~Shape() = default;

    ShapeType getType() const { return m_type; }

    /**
     * @brief Nearest intersection with parameter strictly inside (tMin, tMax)
     * @return std::nullopt on a miss
     */
    [[nodiscard]] virtual std::optional<HitRecord> isHit(const Ray& ray, double tMin, double tMax) const = 0;

protected:
    ShapeType m_type;
};

} // namespace scene
} // namespace prism
