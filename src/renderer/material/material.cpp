#include "material.hpp"

namespace prism {

const char* Material::typeName(Type type) {
    switch (type) {
        case Type::Matte:      return "matte";
        case Type::Metallic:   return "metallic";
        case Type::Dielectric: return "dielectric";
    }
    return "unknown";
}

} // namespace prism
