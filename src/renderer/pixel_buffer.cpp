#include "pixel_buffer.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace prism {

PixelBuffer::PixelBuffer(int w, int h) : width(w), height(h) {
    if (w <= 0 || h <= 0) {
        throw std::invalid_argument("PixelBuffer: dimensions must be positive, got " +
                                    std::to_string(w) + "x" + std::to_string(h));
    }
    pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), Color(0.0));
}

size_t PixelBuffer::index(int x, int y) const {
    if (x < 0 || y < 0 || x >= width || y >= height) {
        throw std::out_of_range("PixelBuffer: pixel (" + std::to_string(x) + ", " +
                                std::to_string(y) + ") outside " +
                                std::to_string(width) + "x" + std::to_string(height));
    }
    return static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x);
}

const Color& PixelBuffer::at(int x, int y) const {
    return pixels[index(x, y)];
}

void PixelBuffer::set(int x, int y, const Color& color) {
    pixels[index(x, y)] = color;
}

uint8_t PixelBuffer::quantize(double linear) {
    if (std::isnan(linear) || linear <= 0.0) {
        return 0;
    }
    double gamma = math::clamp(std::sqrt(linear), 0.0, 1.0);
    return static_cast<uint8_t>(255.999 * gamma);
}

std::vector<uint8_t> PixelBuffer::toRgb8() const {
    std::vector<uint8_t> rgb;
    rgb.reserve(pixels.size() * 3);
    for (const Color& c : pixels) {
        rgb.push_back(quantize(c.r));
        rgb.push_back(quantize(c.g));
        rgb.push_back(quantize(c.b));
    }
    return rgb;
}

Color PixelBuffer::rowAverage(int y) const {
    Color sum(0.0);
    for (int x = 0; x < width; ++x) {
        sum += at(x, y);
    }
    return width > 0 ? sum / static_cast<double>(width) : sum;
}

} // namespace prism
