#include "camera.hpp"
#include "core/random/random_source.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace prism{

Camera::Camera(const CameraSettings& cameraSettings)
    :settings(cameraSettings){
        validate(settings);
        updateBasis();
    }

void
Camera::validate(const CameraSettings& s){
    if(!math::isFinite(s.lookFrom) || !math::isFinite(s.lookAt) || !math::isFinite(s.up)){
        throw std::invalid_argument("Camera: lookFrom, lookAt and up must be finite");
    }
    if(math::isNearZero(s.lookFrom - s.lookAt)){
        throw std::invalid_argument("Camera: lookFrom and lookAt must not coincide");
    }
    if(math::isNearZero(s.up)){
        throw std::invalid_argument("Camera: up vector must not be zero");
    }
    if(math::isNearZero(glm::cross(s.up, math::direction(s.lookFrom - s.lookAt)))){
        throw std::invalid_argument("Camera: up vector must not be parallel to the view direction");
    }
    if(!math::isFinite(s.verticalFov) || s.verticalFov <= 0.0 || s.verticalFov >= 180.0){
        throw std::invalid_argument("Camera: verticalFov must be in (0, 180) degrees, got " +
                                    std::to_string(s.verticalFov));
    }
    if(!math::isFinite(s.aspectRatio) || s.aspectRatio <= 0.0){
        throw std::invalid_argument("Camera: aspectRatio must be positive");
    }
    if(!math::isFinite(s.aperture) || s.aperture < 0.0){
        throw std::invalid_argument("Camera: aperture must be non-negative");
    }
    if(!math::isFinite(s.focusDistance) || s.focusDistance <= 0.0){
        throw std::invalid_argument("Camera: focusDistance must be positive");
    }
}

void
Camera::updateBasis(){
    w = math::direction(settings.lookFrom - settings.lookAt);
    u = math::direction(glm::cross(settings.up, w));
    v = glm::cross(w, u);

    double theta = math::degreesToRadians(settings.verticalFov);
    double viewportHeight = 2.0 * std::tan(theta / 2.0);
    double viewportWidth = settings.aspectRatio * viewportHeight;

    // Viewport sits on the focus plane so objects at focusDistance stay sharp
    origin = settings.lookFrom;
    horizontal = u * (viewportWidth * settings.focusDistance);
    vertical = v * (viewportHeight * settings.focusDistance);
    lowerLeftCorner = origin - horizontal / 2.0 - vertical / 2.0 - w * settings.focusDistance;

    lensRadius = settings.aperture / 2.0;
}

Ray
Camera::castRay(double sx, double sy, RandomSource& rng) const{
    Vec3 offset(0.0);
    if(lensRadius > 0.0){
        Vec3 rd = rng.vectorInUnitDisk() * lensRadius;
        offset = u * rd.x + v * rd.y;
    }

    Vec3 target = lowerLeftCorner + sx * horizontal + sy * vertical;
    Vec3 rayDirection = math::direction(target - origin - offset);

    return Ray(origin + offset, rayDirection);
}

}// namespace prism
