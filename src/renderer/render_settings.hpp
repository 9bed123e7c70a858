#pragma once
#include "core/math/render_math.hpp"
#include "core/random/random_source.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace prism {

struct RenderSettings {
    // Image dimensions
    int imageWidth{800};
    int imageHeight{0};              // 0 = derive from width / aspectRatio
    double aspectRatio{16.0 / 9.0};

    // Sampling
    int samplesPerPixel{25};
    int maxDiffusionDepth{50};
    double hitEpsilon{math::constants::HIT_EPSILON};

    // Background
    Color skyColor{0.5, 0.75, 1.0};
    bool skyGradient{true};          // Blend white -> skyColor by ray height

    // Performance settings
    bool enableMultithreading{true};
    int workerThreads{0};            // 0 = auto-detect

    // Randomness
    std::optional<uint64_t> seed;    // Unset = seed from entropy
    RandomAlgorithm rngAlgorithm{RandomAlgorithm::Xoshiro256StarStar};

    // Throws std::invalid_argument describing the first bad field
    void validate() const;

    // Height after derivation (truncates width / aspectRatio); 0 when it cannot be derived
    int resolveImageHeight() const;

    // Worker count after auto-detection, never less than 1
    int resolveWorkerThreads() const;

private:
    // width / aspectRatio before truncation; infinity on overflow, 0 for a bad ratio
    double derivedHeight() const;
};

// Filled in by Renderer::render()
struct RenderStats {
    int width{0};
    int height{0};
    int rowsCompleted{0};
    uint64_t samplesTraced{0};
    int threadsUsed{0};
    uint64_t seedUsed{0};
    double elapsedSeconds{0.0};
};

} // namespace prism
