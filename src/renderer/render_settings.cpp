#include "render_settings.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

namespace prism {

void RenderSettings::validate() const {
    if (imageWidth <= 0) {
        throw std::invalid_argument("RenderSettings: imageWidth must be positive, got " + std::to_string(imageWidth));
    }
    if (imageHeight < 0) {
        throw std::invalid_argument("RenderSettings: imageHeight must not be negative, got " + std::to_string(imageHeight));
    }
    if (imageHeight == 0 && (!math::isFinite(aspectRatio) || aspectRatio <= 0.0)) {
        throw std::invalid_argument("RenderSettings: aspectRatio must be positive when imageHeight is derived");
    }
    if (imageHeight == 0 && derivedHeight() >= static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("RenderSettings: derived image height overflows (aspectRatio too small)");
    }
    if (resolveImageHeight() <= 0) {
        throw std::invalid_argument("RenderSettings: derived image height is zero (width too small for aspect ratio)");
    }
    if (samplesPerPixel <= 0) {
        throw std::invalid_argument("RenderSettings: samplesPerPixel must be positive, got " + std::to_string(samplesPerPixel));
    }
    if (maxDiffusionDepth <= 0) {
        throw std::invalid_argument("RenderSettings: maxDiffusionDepth must be positive, got " + std::to_string(maxDiffusionDepth));
    }
    if (!math::isFinite(hitEpsilon) || hitEpsilon <= 0.0) {
        throw std::invalid_argument("RenderSettings: hitEpsilon must be finite and positive");
    }
    if (!math::isFinite(skyColor)) {
        throw std::invalid_argument("RenderSettings: skyColor must be finite");
    }
    if (workerThreads < 0) {
        throw std::invalid_argument("RenderSettings: workerThreads must not be negative, got " + std::to_string(workerThreads));
    }
}

int RenderSettings::resolveImageHeight() const {
    if (imageHeight > 0) {
        return imageHeight;
    }
    double height = derivedHeight();
    if (height >= static_cast<double>(std::numeric_limits<int>::max())) {
        return 0;
    }
    return static_cast<int>(height);
}

double RenderSettings::derivedHeight() const {
    if (!math::isFinite(aspectRatio) || aspectRatio <= 0.0) {
        return 0.0;
    }
    double height = static_cast<double>(imageWidth) / aspectRatio;
    return std::isfinite(height) ? height : std::numeric_limits<double>::infinity();
}

int RenderSettings::resolveWorkerThreads() const {
    if (!enableMultithreading) {
        return 1;
    }
    if (workerThreads > 0) {
        return workerThreads;
    }
    return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

} // namespace prism
