#include "default_scene_factory.hpp"
#include "scene/shapes/sphere.hpp"
#include "renderer/material/matte_material.hpp"
#include "renderer/material/metallic_material.hpp"
#include "renderer/material/dielectric_material.hpp"
#include "core/random/random_source.hpp"
#include "core/log/console.hpp"
#include <stdexcept>

namespace prism {

namespace {

constexpr double kGroundRadius = 100000.0;
constexpr double kSmallRadius = 0.2;
constexpr double kGlassIndex = 1.5;

std::shared_ptr<scene::Sphere> makeSphere(const Vec3& center, double radius, Material::Ptr material) {
    return std::make_shared<scene::Sphere>(center, radius, std::move(material));
}

scene::Shape::Ptr glassBall(const Vec3& center) {
    return makeSphere(center, 1.0, std::make_shared<DielectricMaterial>(kGlassIndex, "Glass"));
}

scene::Shape::Ptr matteBall(const Vec3& center) {
    return makeSphere(center, 1.0, std::make_shared<MatteMaterial>(Color(0.4, 0.2, 0.1), "Brown"));
}

scene::Shape::Ptr metalBall(const Vec3& center) {
    return makeSphere(center, 1.0, std::make_shared<MetallicMaterial>(Color(0.7, 0.5, 0.3), 0.0, "Bronze"));
}

} // namespace

scene::Shape::Ptr DefaultSceneFactory::createGround() {
    auto material = std::make_shared<MatteMaterial>(Color(0.5, 0.5, 0.5), "Ground");
    return makeSphere(Vec3(0.0, -kGroundRadius, 0.0), kGroundRadius, material);
}

DefaultSceneFactory::ScenePtr DefaultSceneFactory::createRandomScene(RandomSource& rng) {
    auto world = std::make_shared<scene::ShapeGroup>();

    const Vec3 keepClear(4.0, 0.2, 0.0);

    for (int a = -11; a < 11; ++a) {
        for (int b = -11; b < 11; ++b) {
            Vec3 center(a + 0.9 * rng.uniform(), kSmallRadius, b + 0.9 * rng.uniform());
            if (math::length(center - keepClear) <= 0.9) {
                continue;
            }

            double chooseMaterial = rng.uniform();
            Material::Ptr material;
            if (chooseMaterial < 0.33) {
                material = std::make_shared<MatteMaterial>(rng.vector());
            } else if (chooseMaterial < 0.67) {
                Color albedo = rng.vector();
                material = std::make_shared<MetallicMaterial>(albedo, rng.uniformBetween(0.0, 0.5));
            } else {
                material = std::make_shared<DielectricMaterial>(kGlassIndex);
            }

            world->add(makeSphere(center, kSmallRadius, material));
        }
    }

    world->add(createGround());
    world->add(glassBall(Vec3(0.0, 1.0, 0.0)));
    world->add(matteBall(Vec3(-4.0, 1.0, 0.0)));
    world->add(metalBall(Vec3(4.0, 1.0, 0.0)));

    PRISM_LOG_DEBUG("Random scene built with " + std::to_string(world->size()) + " spheres");
    return world;
}

DefaultSceneFactory::ScenePtr DefaultSceneFactory::createSingleBallScene(scene::Shape::Ptr ball) {
    auto world = std::make_shared<scene::ShapeGroup>();
    world->add(createGround());
    world->add(std::move(ball));
    return world;
}

DefaultSceneFactory::ScenePtr DefaultSceneFactory::createGlassBallScene() {
    return createSingleBallScene(glassBall(Vec3(0.0, 1.0, 0.0)));
}

DefaultSceneFactory::ScenePtr DefaultSceneFactory::createMatteBallScene() {
    return createSingleBallScene(matteBall(Vec3(0.0, 1.0, 0.0)));
}

DefaultSceneFactory::ScenePtr DefaultSceneFactory::createMetalBallScene() {
    return createSingleBallScene(metalBall(Vec3(0.0, 1.0, 0.0)));
}

DefaultSceneFactory::ScenePtr DefaultSceneFactory::createShowcaseScene() {
    auto world = std::make_shared<scene::ShapeGroup>();
    world->add(createGround());
    world->add(glassBall(Vec3(0.0, 1.0, 0.0)));
    world->add(matteBall(Vec3(-4.0, 1.0, 0.0)));
    world->add(metalBall(Vec3(4.0, 1.0, 0.0)));

    // Hollow bubble: the inner sphere flips the index so the shell is thin glass
    const Vec3 bubbleCenter(2.5, 1.0, 2.5);
    world->add(makeSphere(bubbleCenter, 1.0, std::make_shared<DielectricMaterial>(kGlassIndex, "Bubble")));
    world->add(makeSphere(bubbleCenter, 0.9, std::make_shared<DielectricMaterial>(1.0 / kGlassIndex, "BubbleInner")));

    return world;
}

DefaultSceneFactory::ScenePtr DefaultSceneFactory::createByName(const std::string& name, RandomSource& rng) {
    if (name == "random") return createRandomScene(rng);
    if (name == "glass") return createGlassBallScene();
    if (name == "matte") return createMatteBallScene();
    if (name == "metal") return createMetalBallScene();
    if (name == "showcase") return createShowcaseScene();

    std::string known;
    for (const auto& sceneName : availableScenes()) {
        known += (known.empty() ? "" : ", ") + sceneName;
    }
    throw std::invalid_argument("Unknown demo scene '" + name + "' (available: " + known + ")");
}

std::vector<std::string> DefaultSceneFactory::availableScenes() {
    return {"random", "glass", "matte", "metal", "showcase"};
}

} // namespace prism
