#pragma once
#include "renderer/pixel_buffer.hpp"
#include <string>

namespace prism {

// Encodes a finished PixelBuffer to disk. The format follows the file
// extension: .png (also the fallback), .jpg/.jpeg, .bmp, .ppm (ASCII P3).
class ImageWriter {
public:
    enum class Format {
        PNG,
        JPG,
        BMP,
        PPM
    };

    static constexpr int kJpegQuality = 100;

    // Throws std::runtime_error when the file cannot be written
    static void write(const PixelBuffer& buffer, const std::string& filePath);
    static void write(const PixelBuffer& buffer, const std::string& filePath, Format format);

    static Format formatFromPath(const std::string& filePath);
    static const char* formatName(Format format);

private:
    static void writePpm(int width, int height, const std::vector<uint8_t>& rgb, const std::string& filePath);
};

} // namespace prism
