#pragma once
#include "renderer/camera/camera.hpp"
#include "renderer/render_settings.hpp"
#include "renderer/material/material.hpp"
#include "scene/shapes/shape_group.hpp"
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace prism {

// Everything needed for one render: camera, settings, geometry and the target file
struct SceneDescription {
    std::string name{"Untitled"};
    CameraSettings camera;
    RenderSettings render;
    std::shared_ptr<scene::ShapeGroup> world;
    std::string outputFile{"output.png"};
};

// Versioned JSON scene files. Materials are stored once in a name -> material
// table and referenced by name from the shapes.
class SceneSerializer {
public:
    // Throw std::runtime_error on I/O or format errors
    static SceneDescription load(const std::string& filePath);
    static void save(const SceneDescription& description, const std::string& filePath);

    static nlohmann::json toJson(const SceneDescription& description);
    static SceneDescription fromJson(const nlohmann::json& j);

    // Version helpers
    static const char* kMagic();
    static int kVersion();

private:
    static nlohmann::json serializeCamera(const CameraSettings& camera);
    static CameraSettings deserializeCamera(const nlohmann::json& j);

    static nlohmann::json serializeRender(const RenderSettings& render);
    static RenderSettings deserializeRender(const nlohmann::json& j);

    static nlohmann::json serializeMaterial(const Material& material);
    static Material::Ptr deserializeMaterial(const nlohmann::json& j, const std::string& name);
};

} // namespace prism
