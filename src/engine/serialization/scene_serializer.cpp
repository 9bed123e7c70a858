#include "scene_serializer.hpp"
#include "scene/shapes/sphere.hpp"
#include "renderer/material/matte_material.hpp"
#include "renderer/material/metallic_material.hpp"
#include "renderer/material/dielectric_material.hpp"
#include "core/log/console.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace prism {

namespace {

nlohmann::json vec3ToJson(const Vec3& v) {
    return nlohmann::json::array({v.x, v.y, v.z});
}

Vec3 vec3FromJson(const nlohmann::json& j, const char* key, const Vec3& fallback) {
    if (!j.contains(key)) return fallback;
    const auto& a = j.at(key);
    if (!a.is_array() || a.size() != 3) {
        throw std::runtime_error(std::string("Scene file: '") + key + "' must be an array of 3 numbers");
    }
    return Vec3(a[0].get<double>(), a[1].get<double>(), a[2].get<double>());
}

using MaterialNames = std::unordered_map<const Material*, std::string>;
using MaterialTable = std::unordered_map<std::string, Material::Ptr>;

// Collect every distinct material once, keyed by identity
void collectMaterials(const scene::Shape& shape, MaterialNames& names, nlohmann::json& jMaterials,
                      nlohmann::json (*serialize)(const Material&)) {
    if (shape.getType() == scene::ShapeType::GROUP) {
        const auto& group = static_cast<const scene::ShapeGroup&>(shape);
        for (const auto& child : group.getShapes()) {
            collectMaterials(*child, names, jMaterials, serialize);
        }
        return;
    }

    const auto& sphere = static_cast<const scene::Sphere&>(shape);
    const Material* material = sphere.getMaterial().get();
    if (names.count(material)) return;

    std::string name = material->getName().empty() ? "Material" : material->getName();
    std::string unique = name;
    for (int suffix = 1; jMaterials.contains(unique); ++suffix) {
        unique = name + "_" + std::to_string(suffix);
    }
    names[material] = unique;
    jMaterials[unique] = serialize(*material);
}

nlohmann::json serializeShape(const scene::Shape& shape, const MaterialNames& names) {
    nlohmann::json s;
    if (shape.getType() == scene::ShapeType::GROUP) {
        const auto& group = static_cast<const scene::ShapeGroup&>(shape);
        s["type"] = "group";
        nlohmann::json children = nlohmann::json::array();
        for (const auto& child : group.getShapes()) {
            children.push_back(serializeShape(*child, names));
        }
        s["shapes"] = std::move(children);
        return s;
    }

    const auto& sphere = static_cast<const scene::Sphere&>(shape);
    s["type"] = "sphere";
    s["center"] = vec3ToJson(sphere.getCenter());
    s["radius"] = sphere.getRadius();
    s["material"] = names.at(sphere.getMaterial().get());
    return s;
}

} // namespace

const char* SceneSerializer::kMagic() { return "PRISM_SCENE"; }
int SceneSerializer::kVersion() { return 1; }

nlohmann::json SceneSerializer::serializeCamera(const CameraSettings& camera) {
    nlohmann::json c;
    c["lookFrom"] = vec3ToJson(camera.lookFrom);
    c["lookAt"] = vec3ToJson(camera.lookAt);
    c["up"] = vec3ToJson(camera.up);
    c["aspectRatio"] = camera.aspectRatio;
    c["verticalFov"] = camera.verticalFov;
    c["aperture"] = camera.aperture;
    c["focusDistance"] = camera.focusDistance;
    return c;
}

CameraSettings SceneSerializer::deserializeCamera(const nlohmann::json& j) {
    CameraSettings camera;
    camera.lookFrom = vec3FromJson(j, "lookFrom", camera.lookFrom);
    camera.lookAt = vec3FromJson(j, "lookAt", camera.lookAt);
    camera.up = vec3FromJson(j, "up", camera.up);
    camera.aspectRatio = j.value("aspectRatio", camera.aspectRatio);
    camera.verticalFov = j.value("verticalFov", camera.verticalFov);
    camera.aperture = j.value("aperture", camera.aperture);
    camera.focusDistance = j.value("focusDistance", camera.focusDistance);
    return camera;
}

nlohmann::json SceneSerializer::serializeRender(const RenderSettings& render) {
    nlohmann::json r;
    r["imageWidth"] = render.imageWidth;
    r["imageHeight"] = render.imageHeight;
    r["aspectRatio"] = render.aspectRatio;
    r["samplesPerPixel"] = render.samplesPerPixel;
    r["maxDiffusionDepth"] = render.maxDiffusionDepth;
    r["hitEpsilon"] = render.hitEpsilon;
    r["skyColor"] = vec3ToJson(render.skyColor);
    r["skyGradient"] = render.skyGradient;
    r["enableMultithreading"] = render.enableMultithreading;
    r["workerThreads"] = render.workerThreads;
    r["rng"] = RandomSource::algorithmName(render.rngAlgorithm);
    if (render.seed) r["seed"] = *render.seed;
    return r;
}

RenderSettings SceneSerializer::deserializeRender(const nlohmann::json& j) {
    RenderSettings render;
    render.imageWidth = j.value("imageWidth", render.imageWidth);
    render.imageHeight = j.value("imageHeight", render.imageHeight);
    render.aspectRatio = j.value("aspectRatio", render.aspectRatio);
    render.samplesPerPixel = j.value("samplesPerPixel", render.samplesPerPixel);
    render.maxDiffusionDepth = j.value("maxDiffusionDepth", render.maxDiffusionDepth);
    render.hitEpsilon = j.value("hitEpsilon", render.hitEpsilon);
    render.skyColor = vec3FromJson(j, "skyColor", render.skyColor);
    render.skyGradient = j.value("skyGradient", render.skyGradient);
    render.enableMultithreading = j.value("enableMultithreading", render.enableMultithreading);
    render.workerThreads = j.value("workerThreads", render.workerThreads);
    if (j.contains("seed")) render.seed = j.at("seed").get<uint64_t>();
    if (j.contains("rng")) {
        std::string name = j.at("rng").get<std::string>();
        auto algorithm = RandomSource::parseAlgorithm(name);
        if (!algorithm) {
            throw std::runtime_error("Scene file: unknown rng algorithm '" + name + "'");
        }
        render.rngAlgorithm = *algorithm;
    }
    return render;
}

nlohmann::json SceneSerializer::serializeMaterial(const Material& material) {
    nlohmann::json m;
    m["type"] = Material::typeName(material.getType());
    switch (material.getType()) {
        case Material::Type::Matte:
            m["albedo"] = vec3ToJson(static_cast<const MatteMaterial&>(material).getAlbedo());
            break;
        case Material::Type::Metallic: {
            const auto& metal = static_cast<const MetallicMaterial&>(material);
            m["albedo"] = vec3ToJson(metal.getAlbedo());
            m["fuzz"] = metal.getFuzz();
            break;
        }
        case Material::Type::Dielectric:
            m["refractiveIndex"] = static_cast<const DielectricMaterial&>(material).getRefractiveIndex();
            break;
    }
    return m;
}

Material::Ptr SceneSerializer::deserializeMaterial(const nlohmann::json& j, const std::string& name) {
    std::string type = j.value("type", std::string());
    if (type == "matte") {
        return std::make_shared<MatteMaterial>(vec3FromJson(j, "albedo", Color(0.5)), name);
    }
    if (type == "metallic") {
        return std::make_shared<MetallicMaterial>(vec3FromJson(j, "albedo", Color(0.5)),
                                                  j.value("fuzz", 0.0), name);
    }
    if (type == "dielectric") {
        return std::make_shared<DielectricMaterial>(j.value("refractiveIndex", 1.5), name);
    }
    throw std::runtime_error("Scene file: material '" + name + "' has unknown type '" + type + "'");
}

nlohmann::json SceneSerializer::toJson(const SceneDescription& description) {
    nlohmann::json j;
    j["magic"] = kMagic();
    j["version"] = kVersion();
    j["name"] = description.name;
    j["camera"] = serializeCamera(description.camera);
    j["render"] = serializeRender(description.render);
    j["output"] = description.outputFile;

    nlohmann::json jMaterials = nlohmann::json::object();
    nlohmann::json jShapes = nlohmann::json::array();
    if (description.world) {
        MaterialNames names;
        collectMaterials(*description.world, names, jMaterials, &SceneSerializer::serializeMaterial);
        for (const auto& shape : description.world->getShapes()) {
            jShapes.push_back(serializeShape(*shape, names));
        }
    }
    j["materials"] = std::move(jMaterials);
    j["shapes"] = std::move(jShapes);
    return j;
}

namespace {

scene::Shape::Ptr deserializeShape(const nlohmann::json& s, const MaterialTable& materials) {
    std::string type = s.value("type", std::string("sphere"));
    if (type == "group") {
        auto group = std::make_shared<scene::ShapeGroup>();
        if (s.contains("shapes") && s["shapes"].is_array()) {
            for (const auto& child : s["shapes"]) {
                group->add(deserializeShape(child, materials));
            }
        }
        return group;
    }
    if (type != "sphere") {
        throw std::runtime_error("Scene file: unknown shape type '" + type + "'");
    }

    std::string materialName = s.value("material", std::string());
    auto it = materials.find(materialName);
    if (it == materials.end()) {
        throw std::runtime_error("Scene file: sphere references unknown material '" + materialName + "'");
    }
    return std::make_shared<scene::Sphere>(vec3FromJson(s, "center", Vec3(0.0)),
                                           s.value("radius", 1.0), it->second);
}

} // namespace

SceneDescription SceneSerializer::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Scene file: top level must be an object");
    }

    try {
        if (!j.contains("magic") || j["magic"] != kMagic()) {
            throw std::runtime_error(std::string("Scene file: missing or wrong magic (expected ") + kMagic() + ")");
        }
        int version = j.value("version", 0);
        if (version > kVersion()) {
            throw std::runtime_error("Scene file: version " + std::to_string(version) + " is newer than supported " +
                                     std::to_string(kVersion()));
        }

        SceneDescription description;
        description.name = j.value("name", description.name);
        description.outputFile = j.value("output", description.outputFile);
        if (j.contains("camera")) description.camera = deserializeCamera(j["camera"]);
        if (j.contains("render")) description.render = deserializeRender(j["render"]);

        MaterialTable materials;
        if (j.contains("materials") && j["materials"].is_object()) {
            for (const auto& [name, jm] : j["materials"].items()) {
                materials[name] = deserializeMaterial(jm, name);
            }
        }

        description.world = std::make_shared<scene::ShapeGroup>();
        if (j.contains("shapes") && j["shapes"].is_array()) {
            for (const auto& s : j["shapes"]) {
                description.world->add(deserializeShape(s, materials));
            }
        }
        return description;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Scene file: malformed value: ") + e.what());
    }
}

SceneDescription SceneSerializer::load(const std::string& filePath) {
    std::filesystem::path p(filePath);
    if (!std::filesystem::exists(p)) {
        throw std::runtime_error("Scene file not found: " + filePath);
    }
    std::ifstream f(p);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open scene file: " + filePath);
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Cannot parse scene file " + filePath + ": " + e.what());
    }

    SceneDescription description = fromJson(j);
    PRISM_LOG_DEBUG("Loaded scene '" + description.name + "' from " + filePath + " (" +
                    std::to_string(description.world->size()) + " top-level shapes)");
    return description;
}

void SceneSerializer::save(const SceneDescription& description, const std::string& filePath) {
    std::filesystem::path out(filePath);
    if (out.extension().empty()) out += ".json";
    if (out.has_parent_path()) std::filesystem::create_directories(out.parent_path());

    std::ofstream f(out);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot write scene file: " + out.string());
    }
    f << toJson(description).dump(2);
    if (!f) {
        throw std::runtime_error("Error while writing scene file: " + out.string());
    }
    PRISM_LOG_DEBUG("Saved scene '" + description.name + "' to " + out.string());
}

} // namespace prism
