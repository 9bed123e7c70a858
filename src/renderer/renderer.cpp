#include "renderer.hpp"
#include "material/material.hpp"
#include "scene/shapes/shape.hpp"
#include "core/log/console.hpp"
#include "core/random/random_source.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>

namespace prism {

Renderer::Renderer(const RenderSettings& renderSettings, const Camera& renderCamera)
    : settings(renderSettings), camera(renderCamera) {
    settings.validate();
    width = settings.imageWidth;
    height = settings.resolveImageHeight();
}

Color Renderer::skyColor(const Ray& ray) const {
    if (!settings.skyGradient) {
        return settings.skyColor;
    }
    Vec3 unitDir = math::direction(ray.direction);
    double t = 0.5 * (unitDir.y + 1.0);
    return math::lerp(Color(1.0), settings.skyColor, t);
}

Color Renderer::resolveColor(const Ray& ray, const scene::Shape& world, int depth, RandomSource& rng) const {
    // Iterative form of attenuation * resolveColor(scattered, depth - 1)
    Color throughput(1.0);
    Ray current = ray;

    for (int remaining = depth; remaining > 0; --remaining) {
        auto hit = world.isHit(current, settings.hitEpsilon, math::constants::INFINITE_DISTANCE);
        if (!hit) {
            return throughput * skyColor(current);
        }

        if (!hit->material) {
            return Color(0.0);
        }

        ScatterResult result = hit->material->scatter(current, *hit, rng);
        if (!result.didScatter) {
            return Color(0.0);
        }

        throughput *= result.attenuation;
        current = result.scattered;
    }

    // Out of depth: the remaining energy is lost
    return Color(0.0);
}

Color Renderer::samplePixel(int px, int py, const scene::Shape& world, RandomSource& rng) const {
    const double xDenom = static_cast<double>(std::max(width - 1, 1));
    const double yDenom = static_cast<double>(std::max(height - 1, 1));

    Color sum(0.0);
    for (int s = 0; s < settings.samplesPerPixel; ++s) {
        double sx = (px + rng.uniform()) / xDenom;
        double sy = 1.0 - (py + rng.uniform()) / yDenom;
        Ray ray = camera.castRay(sx, sy, rng);
        sum += resolveColor(ray, world, settings.maxDiffusionDepth, rng);
    }
    return sum / static_cast<double>(settings.samplesPerPixel);
}

void Renderer::renderRow(int py, const scene::Shape& world, uint64_t seed, PixelBuffer& buffer) const {
    RandomSource rng = RandomSource::forStream(seed, static_cast<uint64_t>(py), settings.rngAlgorithm);
    for (int px = 0; px < width; ++px) {
        buffer.set(px, py, samplePixel(px, py, world, rng));
    }
}

void Renderer::reportProgress(const std::string& message) {
    if (progressCallback) {
        progressCallback(message);
    }
}

PixelBuffer Renderer::render(const scene::Shape& world) {
    PixelBuffer buffer(width, height);

    const uint64_t seed = settings.seed ? *settings.seed : RandomSource::entropySeed();
    const int threadCount = std::min(settings.resolveWorkerThreads(), height);

    stats = RenderStats{};
    stats.width = width;
    stats.height = height;
    stats.threadsUsed = threadCount;
    stats.seedUsed = seed;

    PRISM_LOG_DEBUG("Rendering " + std::to_string(width) + "x" + std::to_string(height) +
                    " at " + std::to_string(settings.samplesPerPixel) + " spp on " +
                    std::to_string(threadCount) + " thread(s), rng " +
                    RandomSource::algorithmName(settings.rngAlgorithm));

    auto start = std::chrono::steady_clock::now();

    std::atomic<int> nextRow{0};
    std::atomic<int> rowsDone{0};
    std::mutex progressMutex;
    int lastPercent = -1;
    std::exception_ptr workerError;

    auto worker = [&]() {
        try {
            while (true) {
                int py = nextRow.fetch_add(1);
                if (py >= height) {
                    break;
                }
                renderRow(py, world, seed, buffer);

                int done = rowsDone.fetch_add(1) + 1;
                int percent = static_cast<int>(static_cast<int64_t>(done) * 100 / height);
                std::string message;
                {
                    std::lock_guard<std::mutex> lock(progressMutex);
                    if (percent > lastPercent && done < height) {
                        lastPercent = percent;
                        message = "row " + std::to_string(done) + "/" + std::to_string(height) + " done";
                    }
                }
                if (!message.empty()) {
                    reportProgress(message);
                }
            }
        } catch (...) {
            // Keep the first failure; the remaining rows are abandoned
            std::lock_guard<std::mutex> lock(progressMutex);
            if (!workerError) {
                workerError = std::current_exception();
            }
            nextRow.store(height);
        }
    };

    if (threadCount <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(threadCount));
        try {
            for (int i = 0; i < threadCount; ++i) {
                threads.emplace_back(worker);
            }
        } catch (...) {
            nextRow.store(height);
            for (auto& t : threads) {
                t.join();
            }
            throw;
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    if (workerError) {
        PRISM_LOG_DEBUG("Render aborted after " + std::to_string(rowsDone.load()) + "/" +
                        std::to_string(height) + " rows");
        std::rethrow_exception(workerError);
    }

    auto end = std::chrono::steady_clock::now();
    stats.rowsCompleted = rowsDone.load();
    stats.samplesTraced = static_cast<uint64_t>(width) * static_cast<uint64_t>(height) *
                          static_cast<uint64_t>(settings.samplesPerPixel);
    stats.elapsedSeconds = std::chrono::duration<double>(end - start).count();

    reportProgress("row " + std::to_string(height) + "/" + std::to_string(height) + " done");

    return buffer;
}

std::vector<uint8_t> Renderer::renderToRgb8(const scene::Shape& world) {
    return render(world).toRgb8();
}

} // namespace prism
