#pragma once
#include "core/math/render_math.hpp"
#include "core/ray.hpp"

namespace prism {

class RandomSource;

struct CameraSettings {
    Vec3 lookFrom{13.0, 2.0, 3.0};
    Vec3 lookAt{0.0, 0.0, 0.0};
    Vec3 up{0.0, 1.0, 0.0};

    double aspectRatio{16.0 / 9.0};
    double verticalFov{20.0};     // degrees
    double aperture{0.1};
    double focusDistance{10.0};
};

// Thin-lens camera. Immutable after construction; castRay() may be called
// concurrently as long as every thread passes its own RandomSource.
class Camera{
public:
    // Throws std::invalid_argument for degenerate settings
    explicit Camera(const CameraSettings& settings = CameraSettings{});

    // sx, sy are viewport coordinates (0,0 = lower left, 1,1 = upper right).
    // Values slightly outside [0,1] from jitter are fine.
    Ray castRay(double sx, double sy, RandomSource& rng) const;

    const CameraSettings& getSettings() const { return settings; }

    Vec3 getPosition() const { return origin; }
    Vec3 getU() const { return u; }
    Vec3 getV() const { return v; }
    Vec3 getW() const { return w; }
    Vec3 getLowerLeftCorner() const { return lowerLeftCorner; }
    Vec3 getHorizontal() const { return horizontal; }
    Vec3 getVertical() const { return vertical; }
    double getLensRadius() const { return lensRadius; }

private:
    static void validate(const CameraSettings& settings);
    void updateBasis();

    CameraSettings settings;

    // Orthonormal basis: u right, v up, w backwards (away from lookAt)
    Vec3 u{1.0, 0.0, 0.0};
    Vec3 v{0.0, 1.0, 0.0};
    Vec3 w{0.0, 0.0, 1.0};

    Vec3 origin{0.0};
    Vec3 horizontal{0.0};
    Vec3 vertical{0.0};
    Vec3 lowerLeftCorner{0.0};

    double lensRadius{0.0};
};

}// namespace prism
