#pragma once

#include "errors.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace quickswitch {

using CancelCheck = std::function<bool()>;

struct Rgb {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
};

struct RgbImage {
    int width{0};
    int height{0};
    std::vector<Rgb> pixels;

    const Rgb &at(int x, int y) const { return pixels[static_cast<std::size_t>(y) * width + x]; }
};

enum class ImageFormat {
    Unknown,
    Png,
    Jpeg
};

ImageFormat detect_image_format(const std::filesystem::path &path);

bool decode_png(const std::filesystem::path &path, RgbImage &image, Error &error);
bool decode_jpeg(const std::filesystem::path &path, RgbImage &image, Error &error,
                 const CancelCheck &cancelled = {});
bool decode_image(const std::filesystem::path &path, RgbImage &image, Error &error,
                  const CancelCheck &cancelled = {});

// Box filter down to fit inside max_width x max_height, keeping the aspect ratio.
// Images that already fit are returned unchanged.
RgbImage downscale(const RgbImage &image, int max_width, int max_height);

}
