#pragma once

#include "scene/shapes/shape_group.hpp"
#include <memory>
#include <string>
#include <vector>

namespace prism {

class RandomSource;

/**
 * Factory for the built-in demo scenes. Every scene sits on the same large
 * ground sphere and is framed for the default camera at (13,2,3).
 */
class DefaultSceneFactory {
public:
    using ScenePtr = std::shared_ptr<scene::ShapeGroup>;

    /**
     * Ground, a 22x22 grid of small random spheres and three large feature
     * spheres (glass, matte, metal). Layout and materials come from rng.
     */
    static ScenePtr createRandomScene(RandomSource& rng);

    // Ground plus one unit ball at (0,1,0)
    static ScenePtr createGlassBallScene();
    static ScenePtr createMatteBallScene();
    static ScenePtr createMetalBallScene();

    /**
     * Ground, the three feature spheres and a hollow glass bubble in front
     */
    static ScenePtr createShowcaseScene();

    // Throws std::invalid_argument for a name not in availableScenes()
    static ScenePtr createByName(const std::string& name, RandomSource& rng);
    static std::vector<std::string> availableScenes();

    static scene::Shape::Ptr createGround();

private:
    static ScenePtr createSingleBallScene(scene::Shape::Ptr ball);
};

} // namespace prism
