#pragma once

#include "shape.hpp"
#include <vector>

namespace prism {
namespace scene {

// Aggregate of shapes that is itself a Shape. Linear scan, nearest hit wins.
class ShapeGroup : public Shape {
public:
    ShapeGroup() : Shape(ShapeType::GROUP) {}
    explicit ShapeGroup(std::vector<Shape::Ptr> shapes);
    ~ShapeGroup() override = default;

    // Throws std::invalid_argument on null
    void add(Shape::Ptr shape);
    void clear() { m_shapes.clear(); }

    size_t size() const { return m_shapes.size(); }
    bool empty() const { return m_shapes.empty(); }
    const std::vector<Shape::Ptr>& getShapes() const { return m_shapes; }

    [[nodiscard]] std::optional<HitRecord> isHit(const Ray& ray, double tMin, double tMax) const override;

private:
    std::vector<Shape::Ptr> m_shapes;
};

} // namespace scene
} // namespace prism
