/**
 * renderer_tests.cpp - Path tracing loop, sampling, determinism and output
 */

#include "test_framework.hpp"
#include "renderer/renderer.hpp"
#include "renderer/material/matte_material.hpp"
#include "renderer/material/metallic_material.hpp"
#include "renderer/material/dielectric_material.hpp"
#include "scene/shapes/sphere.hpp"
#include "scene/shapes/shape_group.hpp"
#include "core/random/random_source.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace prism::tests {

using scene::Sphere;
using scene::ShapeGroup;

namespace {

const Color kGroundAlbedo(0.8, 0.2, 0.2);

std::shared_ptr<ShapeGroup> groundScene() {
    auto world = std::make_shared<ShapeGroup>();
    world->add(std::make_shared<Sphere>(Vec3(0.0, -100000.0, 0.0), 100000.0,
                                        std::make_shared<MatteMaterial>(kGroundAlbedo, "Ground")));
    return world;
}

std::shared_ptr<ShapeGroup> ballScene() {
    auto world = groundScene();
    world->add(std::make_shared<Sphere>(Vec3(0.0, 1.0, 0.0), 1.0, std::make_shared<DielectricMaterial>(1.5)));
    world->add(std::make_shared<Sphere>(Vec3(-4.0, 1.0, 0.0), 1.0,
                                        std::make_shared<MetallicMaterial>(Color(0.7, 0.5, 0.3), 0.2)));
    return world;
}

RenderSettings smallSettings() {
    RenderSettings s;
    s.imageWidth = 48;
    s.samplesPerPixel = 6;
    s.maxDiffusionDepth = 12;
    s.seed = 2024;
    s.workerThreads = 1;
    return s;
}

double luminance(const Color& c) {
    return c.r + c.g + c.b;
}

Color averageRows(const PixelBuffer& buffer, int first, int last) {
    Color sum(0.0);
    for (int y = first; y <= last; ++y) {
        sum += buffer.rowAverage(y);
    }
    return sum / static_cast<double>(last - first + 1);
}

}

bool testMissReturnsSky() {
    TEST_BEGIN("a ray that misses everything returns the sky");

    RenderSettings s = smallSettings();
    Renderer renderer(s, Camera());
    ShapeGroup empty;
    RandomSource rng(1);

    Color straightUp = renderer.resolveColor(Ray(Vec3(0.0), Vec3(0.0, 1.0, 0.0)), empty, 50, rng);
    EXPECT_VEC_NEAR(straightUp, s.skyColor, 1e-12);

    Color horizontal = renderer.resolveColor(Ray(Vec3(0.0), Vec3(1.0, 0.0, 0.0)), empty, 50, rng);
    EXPECT_VEC_NEAR(horizontal, math::lerp(Color(1.0), s.skyColor, 0.5), 1e-12);

    Color down = renderer.resolveColor(Ray(Vec3(0.0), Vec3(0.0, -3.0, 0.0)), empty, 50, rng);
    EXPECT_VEC_NEAR(down, Color(1.0), 1e-12);

    s.skyGradient = false;
    s.skyColor = Color(0.1, 0.2, 0.3);
    Renderer flat(s, Camera());
    EXPECT_VEC_NEAR(flat.resolveColor(Ray(Vec3(0.0), Vec3(0.3, -0.7, 0.1)), empty, 50, rng),
                    Color(0.1, 0.2, 0.3), 0.0);

    TEST_PASS();
    return true;
}

bool testDepthZeroIsBlack() {
    TEST_BEGIN("depth 0 resolves to black");

    Renderer renderer(smallSettings(), Camera());
    ShapeGroup empty;
    RandomSource rng(1);
    EXPECT_VEC_NEAR(renderer.resolveColor(Ray(Vec3(0.0), Vec3(0.0, 1.0, 0.0)), empty, 0, rng), Color(0.0), 0.0);

    TEST_PASS();
    return true;
}

bool testTrappedPathIsBlack() {
    TEST_BEGIN("a path that never escapes ends black at max depth");

    ShapeGroup world;
    world.add(std::make_shared<Sphere>(Vec3(0.0), 1.0, std::make_shared<MetallicMaterial>(Color(1.0), 0.0)));

    Renderer renderer(smallSettings(), Camera());
    RandomSource rng(3);
    Color c = renderer.resolveColor(Ray(Vec3(0.0), math::direction(Vec3(0.3, 0.5, 0.2))), world, 50, rng);
    EXPECT_VEC_NEAR(c, Color(0.0), 0.0);

    TEST_PASS();
    return true;
}

bool testSingleDiffuseBounce() {
    TEST_BEGIN("one diffuse bounce gives albedo times sky");

    auto world = groundScene();
    Renderer renderer(smallSettings(), Camera());
    RandomSource rng(8);
    const Color skyColor = renderer.getSettings().skyColor;

    for (int i = 0; i < 500; ++i) {
        Color c = renderer.resolveColor(Ray(Vec3(0.0, 2.0, 0.0), Vec3(0.0, -1.0, 0.0)), *world, 2, rng);
        // Upward scatter sees the sky between the horizon colour and the zenith colour
        EXPECT_TRUE(c.r <= kGroundAlbedo.r + 1e-12 && c.r >= kGroundAlbedo.r * skyColor.r - 1e-12);
        EXPECT_TRUE(c.b <= kGroundAlbedo.b + 1e-12 && c.b >= kGroundAlbedo.b * skyColor.b - 1e-12);
    }

    // A single bounce budget cannot reach the sky after hitting the ground
    Color exhausted = renderer.resolveColor(Ray(Vec3(0.0, 2.0, 0.0), Vec3(0.0, -1.0, 0.0)), *world, 1, rng);
    EXPECT_VEC_NEAR(exhausted, Color(0.0), 0.0);

    TEST_PASS();
    return true;
}

bool testImageHeightDerivation() {
    TEST_BEGIN("image height truncates width / aspect ratio");

    RenderSettings s;
    EXPECT_EQ(s.resolveImageHeight(), 450);
    s.imageWidth = 401;
    EXPECT_EQ(s.resolveImageHeight(), 225);
    s.imageHeight = 100;
    EXPECT_EQ(s.resolveImageHeight(), 100);

    Renderer renderer(smallSettings(), Camera());
    EXPECT_EQ(renderer.getImageWidth(), 48);
    EXPECT_EQ(renderer.getImageHeight(), 27);

    TEST_PASS();
    return true;
}

bool testRejectsBadSettings() {
    TEST_BEGIN("invalid render settings fail before any pixel work");

    RenderSettings zeroSamples = smallSettings();
    zeroSamples.samplesPerPixel = 0;
    EXPECT_THROWS(Renderer r(zeroSamples, Camera()), std::invalid_argument);

    RenderSettings zeroWidth = smallSettings();
    zeroWidth.imageWidth = 0;
    EXPECT_THROWS(Renderer r(zeroWidth, Camera()), std::invalid_argument);

    RenderSettings zeroDepth = smallSettings();
    zeroDepth.maxDiffusionDepth = 0;
    EXPECT_THROWS(Renderer r(zeroDepth, Camera()), std::invalid_argument);

    RenderSettings tooNarrow = smallSettings();
    tooNarrow.imageWidth = 1;
    EXPECT_THROWS(Renderer r(tooNarrow, Camera()), std::invalid_argument);

    RenderSettings negativeThreads = smallSettings();
    negativeThreads.workerThreads = -2;
    EXPECT_THROWS(Renderer r(negativeThreads, Camera()), std::invalid_argument);

    RenderSettings tinyAspect = smallSettings();
    tinyAspect.aspectRatio = 1e-9;
    EXPECT_EQ(tinyAspect.resolveImageHeight(), 0);
    EXPECT_THROWS(Renderer r(tinyAspect, Camera()), std::invalid_argument);

    RenderSettings denormalAspect = smallSettings();
    denormalAspect.aspectRatio = 1e-320;
    EXPECT_THROWS(denormalAspect.validate(), std::invalid_argument);

    RenderSettings zeroEpsilon = smallSettings();
    zeroEpsilon.hitEpsilon = 0.0;
    EXPECT_THROWS(Renderer r(zeroEpsilon, Camera()), std::invalid_argument);

    RenderSettings badSky = smallSettings();
    badSky.skyColor = Color(std::nan(""), 0.0, 0.0);
    EXPECT_THROWS(Renderer r(badSky, Camera()), std::invalid_argument);

    TEST_PASS();
    return true;
}

bool testSeededRenderIsRepeatable() {
    TEST_BEGIN("same seed renders pixel-identical images");

    auto world = ballScene();
    Renderer first(smallSettings(), Camera());
    Renderer second(smallSettings(), Camera());

    std::vector<uint8_t> a = first.renderToRgb8(*world);
    std::vector<uint8_t> b = second.renderToRgb8(*world);
    EXPECT_EQ(a.size(), static_cast<size_t>(48 * 27 * 3));
    EXPECT_TRUE(a == b);

    RenderSettings other = smallSettings();
    other.seed = 2025;
    Renderer third(other, Camera());
    EXPECT_FALSE(a == third.renderToRgb8(*world));

    TEST_PASS();
    return true;
}

bool testThreadCountDoesNotChangeImage() {
    TEST_BEGIN("thread count does not change a seeded image");

    auto world = ballScene();

    RenderSettings single = smallSettings();
    single.enableMultithreading = false;
    Renderer singleRenderer(single, Camera());
    PixelBuffer reference = singleRenderer.render(*world);
    EXPECT_EQ(singleRenderer.getStats().threadsUsed, 1);

    for (int threads : {2, 3, 8}) {
        RenderSettings parallel = smallSettings();
        parallel.workerThreads = threads;
        Renderer parallelRenderer(parallel, Camera());
        PixelBuffer image = parallelRenderer.render(*world);
        EXPECT_EQ(parallelRenderer.getStats().threadsUsed, threads);
        EXPECT_TRUE(image.getPixels() == reference.getPixels());
    }

    TEST_PASS();
    return true;
}

bool testGroundSceneEndToEnd() {
    TEST_BEGIN("ground scene: ground colour at the bottom, sky at the top");

    auto world = groundScene();
    RenderSettings s = smallSettings();
    s.workerThreads = 0;
    Renderer renderer(s, Camera());
    PixelBuffer image = renderer.render(*world);

    const int h = image.getHeight();
    Color top = averageRows(image, 0, h / 4);
    Color bottom = averageRows(image, h - 1 - h / 4, h - 1);

    EXPECT_TRUE(luminance(bottom) > 0.0);
    EXPECT_TRUE(luminance(top) > 0.0);

    // Ground is red, sky is blue
    EXPECT_TRUE(bottom.r > bottom.b);
    EXPECT_TRUE(top.b > top.r);

    // Top row looks just above the horizon: pure sky gradient
    Color firstRow = image.rowAverage(0);
    EXPECT_TRUE(firstRow.b > 0.95);
    EXPECT_TRUE(firstRow.r > 0.6 && firstRow.r < 0.8);

    const RenderStats& stats = renderer.getStats();
    EXPECT_EQ(stats.rowsCompleted, h);
    EXPECT_EQ(stats.samplesTraced, static_cast<uint64_t>(48) * h * s.samplesPerPixel);
    EXPECT_EQ(stats.seedUsed, 2024u);

    TEST_PASS();
    return true;
}

bool testMoreSamplesLessNoise() {
    TEST_BEGIN("more samples per pixel lowers pixel variance");

    auto world = ballScene();

    auto pixelStdDev = [&](int spp) {
        RenderSettings s = smallSettings();
        s.samplesPerPixel = spp;
        Renderer renderer(s, Camera());

        const int runs = 40;
        double sum = 0.0;
        double sumSq = 0.0;
        for (int run = 0; run < runs; ++run) {
            RandomSource rng(1000 + static_cast<uint64_t>(run));
            // Diffuse ground between the camera and the balls
            double value = luminance(renderer.samplePixel(24, 22, *world, rng));
            sum += value;
            sumSq += value * value;
        }
        double mean = sum / runs;
        return std::sqrt(std::max(0.0, sumSq / runs - mean * mean));
    };

    double sd1 = pixelStdDev(1);
    double sd16 = pixelStdDev(16);
    double sd64 = pixelStdDev(64);

    EXPECT_TRUE(sd1 > 0.0);
    EXPECT_TRUE(sd16 < sd1);
    EXPECT_TRUE(sd64 < sd16);

    TEST_PASS();
    return true;
}

bool testProgressMessages() {
    TEST_BEGIN("progress reports rows in whole-percent steps");

    auto world = groundScene();
    RenderSettings s = smallSettings();
    s.workerThreads = 4;
    s.samplesPerPixel = 1;
    Renderer renderer(s, Camera());

    std::mutex messagesMutex;
    std::vector<std::string> messages;
    renderer.setProgressCallback([&](const std::string& message) {
        std::lock_guard<std::mutex> lock(messagesMutex);
        messages.push_back(message);
    });
    renderer.render(*world);

    const int h = renderer.getImageHeight();
    EXPECT_FALSE(messages.empty());
    EXPECT_TRUE(static_cast<int>(messages.size()) <= h);
    EXPECT_TRUE(messages.size() <= 101u);
    EXPECT_EQ(messages.back(), "row " + std::to_string(h) + "/" + std::to_string(h) + " done");
    for (const auto& message : messages) {
        EXPECT_EQ(message.rfind("row ", 0), 0u);
    }

    TEST_PASS();
    return true;
}

bool testCallbackFailureReachesCaller() {
    TEST_BEGIN("an exception thrown by the progress callback propagates out of render()");

    auto world = groundScene();
    for (int threads : {1, 4}) {
        RenderSettings s = smallSettings();
        s.workerThreads = threads;
        s.samplesPerPixel = 1;
        Renderer renderer(s, Camera());

        std::atomic<int> calls{0};
        renderer.setProgressCallback([&](const std::string&) {
            calls.fetch_add(1);
            throw std::runtime_error("progress sink closed");
        });
        EXPECT_THROWS(renderer.render(*world), std::runtime_error);
        EXPECT_TRUE(calls.load() >= 1);
        EXPECT_TRUE(calls.load() <= threads);

        // The same renderer still works once the callback behaves
        renderer.setProgressCallback(nullptr);
        EXPECT_NO_THROW(renderer.render(*world));
        EXPECT_EQ(renderer.getStats().rowsCompleted, renderer.getImageHeight());
    }

    TEST_PASS();
    return true;
}

bool testQuantization() {
    TEST_BEGIN("gamma 2 and 8-bit quantization");

    EXPECT_EQ(PixelBuffer::quantize(0.0), 0);
    EXPECT_EQ(PixelBuffer::quantize(0.25), 127);
    EXPECT_EQ(PixelBuffer::quantize(1.0), 255);
    EXPECT_EQ(PixelBuffer::quantize(9.0), 255);
    EXPECT_EQ(PixelBuffer::quantize(-0.5), 0);
    EXPECT_EQ(PixelBuffer::quantize(std::nan("")), 0);

    PixelBuffer buffer(2, 1);
    buffer.set(1, 0, Color(1.0, 0.25, 0.0));
    std::vector<uint8_t> rgb = buffer.toRgb8();
    EXPECT_EQ(rgb.size(), 6u);
    EXPECT_EQ(rgb[3], 255);
    EXPECT_EQ(rgb[4], 127);
    EXPECT_EQ(rgb[5], 0);

    EXPECT_THROWS(buffer.at(2, 0), std::out_of_range);
    EXPECT_THROWS(PixelBuffer bad(0, 3), std::invalid_argument);

    TEST_PASS();
    return true;
}

int runAllTests() {
    std::cout << "\n\033[1m=== Prism Renderer Tests ===\033[0m" << std::endl;

    printSection("Color resolution");
    testMissReturnsSky();
    testDepthZeroIsBlack();
    testTrappedPathIsBlack();
    testSingleDiffuseBounce();

    printSection("Settings");
    testImageHeightDerivation();
    testRejectsBadSettings();

    printSection("Rendering");
    testSeededRenderIsRepeatable();
    testThreadCountDoesNotChangeImage();
    testGroundSceneEndToEnd();
    testMoreSamplesLessNoise();
    testProgressMessages();
    testCallbackFailureReachesCaller();

    printSection("Output");
    testQuantization();

    return printResults("Renderer");
}

} // namespace prism::tests

int main() {
    return prism::tests::runAllTests();
}
