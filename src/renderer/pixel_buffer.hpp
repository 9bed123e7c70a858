#pragma once
#include "core/math/render_math.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace prism {

// Row-major grid of linear colours, row 0 at the top of the image
class PixelBuffer {
public:
    PixelBuffer() = default;
    PixelBuffer(int width, int height);

    int getWidth() const { return width; }
    int getHeight() const { return height; }
    bool empty() const { return pixels.empty(); }

    // Throws std::out_of_range outside the grid
    const Color& at(int x, int y) const;
    void set(int x, int y, const Color& color);

    const std::vector<Color>& getPixels() const { return pixels; }

    // Gamma 2 (sqrt), clamp to [0,1], 8 bits per channel, RGB interleaved
    std::vector<uint8_t> toRgb8() const;

    static uint8_t quantize(double linear);

    // Mean linear colour of one row
    Color rowAverage(int y) const;

private:
    size_t index(int x, int y) const;

    int width{0};
    int height{0};
    std::vector<Color> pixels;
};

} // namespace prism
