#pragma once
#include "core/math/render_math.hpp"
#include "core/ray.hpp"
#include "scene/hit_record.hpp"
#include <memory>
#include <string>

namespace prism {

class RandomSource;

// Outcome of one bounce. When didScatter is false the path was absorbed and
// the other fields carry no meaning.
struct ScatterResult {
    Ray scattered;
    Color attenuation{1.0};
    bool didScatter{false};
};

// Scattering policy of a surface. Materials are immutable and shared between
// shapes, so scatter() must not touch member state.
class Material {
public:
    enum class Type {
        Matte,
        Metallic,
        Dielectric
    };

    using Ptr = std::shared_ptr<const Material>;

    virtual ~Material() = default;

    virtual ScatterResult scatter(const Ray& incoming, const HitRecord& hit, RandomSource& rng) const = 0;

    Type getType() const { return type; }
    const std::string& getName() const { return name; }

    static const char* typeName(Type type);

protected:
    Material(Type materialType, std::string materialName)
        : type(materialType), name(std::move(materialName)) {}

private:
    Type type;
    std::string name;
};

} // namespace prism
