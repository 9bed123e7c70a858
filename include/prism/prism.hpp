#pragma once

// Public entry point: everything needed to build a scene, render it and
// write the image.

#include "core/math/render_math.hpp"
#include "core/random/random_source.hpp"
#include "core/log/console.hpp"
#include "scene/shapes/sphere.hpp"
#include "scene/shapes/shape_group.hpp"
#include "renderer/camera/camera.hpp"
#include "renderer/material/matte_material.hpp"
#include "renderer/material/metallic_material.hpp"
#include "renderer/material/dielectric_material.hpp"
#include "renderer/render_settings.hpp"
#include "renderer/renderer.hpp"
#include "renderer/output/image_writer.hpp"
#include "engine/scene/default_scene_factory.hpp"
#include "engine/serialization/scene_serializer.hpp"

namespace prism {

constexpr const char* kVersionString = "1.0.0";

} // namespace prism
