#pragma once
/**
 * renderer.hpp - CPU path tracer
 *
 * For every pixel the renderer averages samplesPerPixel jittered camera rays,
 * each resolved by bouncing through the scene until it escapes to the sky,
 * is absorbed, or runs out of depth. Rows are independent: workers claim
 * whole rows from an atomic counter and write disjoint cells of the buffer.
 *
 * Every row draws from its own RandomSource::forStream(seed, row), so a
 * seeded render is pixel-identical whatever the thread count.
 */

#include "camera/camera.hpp"
#include "pixel_buffer.hpp"
#include "render_settings.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace prism {

class RandomSource;

namespace scene {
class Shape;
}

class Renderer {
public:
    using ProgressCallback = std::function<void(const std::string&)>;

    // Validates settings; throws std::invalid_argument
    Renderer(const RenderSettings& settings, const Camera& camera);

    // Called from the worker threads, possibly concurrently and out of row order.
    // The final "row H/H done" message is always delivered last, on the caller's thread.
    void setProgressCallback(ProgressCallback callback) { progressCallback = std::move(callback); }

    // Linear, sample-averaged colours. An exception thrown on a worker
    // (including from the progress callback) stops the render and is rethrown here.
    PixelBuffer render(const scene::Shape& world);

    // render() followed by gamma + 8-bit quantization
    std::vector<uint8_t> renderToRgb8(const scene::Shape& world);

    // Colour carried back along one camera ray, at most `depth` bounces
    Color resolveColor(const Ray& ray, const scene::Shape& world, int depth, RandomSource& rng) const;

    // Averaged colour of one pixel (px from the left, py from the top)
    Color samplePixel(int px, int py, const scene::Shape& world, RandomSource& rng) const;

    // Background seen by a ray that hits nothing
    Color skyColor(const Ray& ray) const;

    const RenderSettings& getSettings() const { return settings; }
    const Camera& getCamera() const { return camera; }
    const RenderStats& getStats() const { return stats; }
    int getImageWidth() const { return width; }
    int getImageHeight() const { return height; }

private:
    void renderRow(int py, const scene::Shape& world, uint64_t seed, PixelBuffer& buffer) const;
    void reportProgress(const std::string& message);

    RenderSettings settings;
    Camera camera;
    int width{0};
    int height{0};

    RenderStats stats;
    ProgressCallback progressCallback;
};

} // namespace prism
