#include "image_writer.hpp"
#include "core/log/console.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace prism {

ImageWriter::Format ImageWriter::formatFromPath(const std::string& filePath) {
    std::string ext = std::filesystem::path(filePath).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".jpg" || ext == ".jpeg") return Format::JPG;
    if (ext == ".bmp") return Format::BMP;
    if (ext == ".ppm") return Format::PPM;
    return Format::PNG;
}

const char* ImageWriter::formatName(Format format) {
    switch (format) {
        case Format::PNG: return "png";
        case Format::JPG: return "jpg";
        case Format::BMP: return "bmp";
        case Format::PPM: return "ppm";
    }
    return "png";
}

void ImageWriter::write(const PixelBuffer& buffer, const std::string& filePath) {
    write(buffer, filePath, formatFromPath(filePath));
}

void ImageWriter::write(const PixelBuffer& buffer, const std::string& filePath, Format format) {
    if (buffer.empty()) {
        throw std::runtime_error("ImageWriter: refusing to write an empty image to " + filePath);
    }

    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("ImageWriter: cannot create directory " +
                                     path.parent_path().string() + ": " + ec.message());
        }
    }

    const int width = buffer.getWidth();
    const int height = buffer.getHeight();
    std::vector<uint8_t> rgb = buffer.toRgb8();

    int ok = 0;
    switch (format) {
        case Format::PNG:
            ok = stbi_write_png(filePath.c_str(), width, height, 3, rgb.data(), width * 3);
            break;
        case Format::JPG:
            ok = stbi_write_jpg(filePath.c_str(), width, height, 3, rgb.data(), kJpegQuality);
            break;
        case Format::BMP:
            ok = stbi_write_bmp(filePath.c_str(), width, height, 3, rgb.data());
            break;
        case Format::PPM:
            writePpm(width, height, rgb, filePath);
            ok = 1;
            break;
    }

    if (!ok) {
        throw std::runtime_error("ImageWriter: failed to write " + std::string(formatName(format)) +
                                 " image " + filePath);
    }

    PRISM_LOG_DEBUG("Wrote " + std::to_string(width) + "x" + std::to_string(height) + " " +
                    formatName(format) + " image to " + filePath);
}

void ImageWriter::writePpm(int width, int height, const std::vector<uint8_t>& rgb, const std::string& filePath) {
    std::ofstream out(filePath);
    if (!out) {
        throw std::runtime_error("ImageWriter: cannot open " + filePath + " for writing");
    }

    out << "P3\n" << width << ' ' << height << "\n255\n";
    for (size_t i = 0; i + 2 < rgb.size(); i += 3) {
        out << static_cast<int>(rgb[i]) << ' '
            << static_cast<int>(rgb[i + 1]) << ' '
            << static_cast<int>(rgb[i + 2]) << '\n';
    }

    if (!out) {
        throw std::runtime_error("ImageWriter: error while writing " + filePath);
    }
}

} // namespace prism
