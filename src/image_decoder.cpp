#include "image_decoder.hpp"

#include <algorithm>
#include <array>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>

#include <jpeglib.h>
#include <png.h>

namespace quickswitch {

namespace {

constexpr std::uint64_t kMaxDecodedPixels = 64ULL * 1024 * 1024;

struct JpegErrorManager {
    jpeg_error_mgr base;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto *manager = reinterpret_cast<JpegErrorManager *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, manager->message);
    std::longjmp(manager->jump, 1);
}

void jpeg_silence(j_common_ptr, int) {}

}

ImageFormat detect_image_format(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ImageFormat::Unknown;
    }
    std::array<unsigned char, 8> magic{};
    file.read(reinterpret_cast<char *>(magic.data()), static_cast<std::streamsize>(magic.size()));
    const auto read = file.gcount();

    static const std::array<unsigned char, 8> kPngSignature{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (read == 8 && magic == kPngSignature) {
        return ImageFormat::Png;
    }
    if (read >= 3 && magic[0] == 0xFF && magic[1] == 0xD8 && magic[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    return ImageFormat::Unknown;
}

bool decode_png(const std::filesystem::path &path, RgbImage &image, Error &error) {
    png_image png;
    std::memset(&png, 0, sizeof(png));
    png.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_file(&png, path.c_str())) {
        error = Error{ErrorKind::DecodeFailure, "PNG decode failed: " + std::string(png.message)};
        return false;
    }

    if (static_cast<std::uint64_t>(png.width) * png.height > kMaxDecodedPixels) {
        png_image_free(&png);
        error = Error{ErrorKind::DecodeFailure, "PNG too large to preview"};
        return false;
    }

    png.format = PNG_FORMAT_RGB;
    std::vector<png_byte> buffer(PNG_IMAGE_SIZE(png));
    png_color background{0, 0, 0};
    if (!png_image_finish_read(&png, &background, buffer.data(), 0, nullptr)) {
        error = Error{ErrorKind::DecodeFailure, "PNG decode failed: " + std::string(png.message)};
        png_image_free(&png);
        return false;
    }

    image.width = static_cast<int>(png.width);
    image.height = static_cast<int>(png.height);
    image.pixels.resize(static_cast<std::size_t>(image.width) * image.height);
    for (std::size_t i = 0; i < image.pixels.size(); ++i) {
        image.pixels[i] = Rgb{buffer[i * 3], buffer[i * 3 + 1], buffer[i * 3 + 2]};
    }
    return true;
}

bool decode_jpeg(const std::filesystem::path &path, RgbImage &image, Error &error,
                 const CancelCheck &cancelled) {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> file(std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!file) {
        error = Error{ErrorKind::IoFailure, "Unable to open image: " + path.string()};
        return false;
    }

    jpeg_decompress_struct cinfo;
    JpegErrorManager manager;
    cinfo.err = jpeg_std_error(&manager.base);
    manager.base.error_exit = jpeg_error_exit;
    manager.base.emit_message = jpeg_silence;
    std::vector<JSAMPLE> row;

    if (setjmp(manager.jump)) {
        jpeg_destroy_decompress(&cinfo);
        error = Error{ErrorKind::DecodeFailure, std::string("JPEG decode failed: ") + manager.message};
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, file.get());
    jpeg_read_header(&cinfo, TRUE);
    cinfo.out_color_space = JCS_RGB;

    if (static_cast<std::uint64_t>(cinfo.image_width) * cinfo.image_height > kMaxDecodedPixels) {
        jpeg_destroy_decompress(&cinfo);
        error = Error{ErrorKind::DecodeFailure, "JPEG too large to preview"};
        return false;
    }

    // Let libjpeg's DCT scaling do the bulk of the reduction for large photos.
    while (cinfo.scale_denom < 8 &&
           cinfo.image_width / (cinfo.scale_denom * 2) >= 512 &&
           cinfo.image_height / (cinfo.scale_denom * 2) >= 512) {
        cinfo.scale_denom *= 2;
    }

    jpeg_start_decompress(&cinfo);

    image.width = static_cast<int>(cinfo.output_width);
    image.height = static_cast<int>(cinfo.output_height);
    image.pixels.assign(static_cast<std::size_t>(image.width) * image.height, Rgb{});
    row.resize(static_cast<std::size_t>(cinfo.output_width) * cinfo.output_components);

    while (cinfo.output_scanline < cinfo.output_height) {
        if (cancelled && cancelled()) {
            jpeg_abort_decompress(&cinfo);
            jpeg_destroy_decompress(&cinfo);
            error = Error{ErrorKind::DecodeFailure, "JPEG decode cancelled"};
            return false;
        }
        JSAMPROW rows[1] = {row.data()};
        const JDIMENSION y = cinfo.output_scanline;
        jpeg_read_scanlines(&cinfo, rows, 1);
        for (int x = 0; x < image.width; ++x) {
            const std::size_t offset = static_cast<std::size_t>(x) * cinfo.output_components;
            image.pixels[static_cast<std::size_t>(y) * image.width + x] =
                Rgb{row[offset], row[offset + 1], row[offset + 2]};
        }
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

bool decode_image(const std::filesystem::path &path, RgbImage &image, Error &error,
                  const CancelCheck &cancelled) {
    switch (detect_image_format(path)) {
        case ImageFormat::Png:
            return decode_png(path, image, error);
        case ImageFormat::Jpeg:
            return decode_jpeg(path, image, error, cancelled);
        case ImageFormat::Unknown:
            break;
    }
    error = Error{ErrorKind::DecodeFailure, "Unrecognized image data: " + path.filename().string()};
    return false;
}

RgbImage downscale(const RgbImage &image, int max_width, int max_height) {
    if (image.width <= 0 || image.height <= 0 || max_width <= 0 || max_height <= 0) {
        return RgbImage{};
    }
    if (image.width <= max_width && image.height <= max_height) {
        return image;
    }

    const double scale = std::min(static_cast<double>(max_width) / image.width,
                                  static_cast<double>(max_height) / image.height);
    RgbImage result;
    result.width = std::max(1, static_cast<int>(image.width * scale));
    result.height = std::max(1, static_cast<int>(image.height * scale));
    result.pixels.resize(static_cast<std::size_t>(result.width) * result.height);

    for (int y = 0; y < result.height; ++y) {
        const int y0 = y * image.height / result.height;
        const int y1 = std::max(y0 + 1, (y + 1) * image.height / result.height);
        for (int x = 0; x < result.width; ++x) {
            const int x0 = x * image.width / result.width;
            const int x1 = std::max(x0 + 1, (x + 1) * image.width / result.width);

            unsigned long r = 0, g = 0, b = 0, count = 0;
            for (int sy = y0; sy < y1; ++sy) {
                for (int sx = x0; sx < x1; ++sx) {
                    const Rgb &p = image.at(sx, sy);
                    r += p.r;
                    g += p.g;
                    b += p.b;
                    ++count;
                }
            }
            result.pixels[static_cast<std::size_t>(y) * result.width + x] =
                Rgb{static_cast<std::uint8_t>(r / count), static_cast<std::uint8_t>(g / count),
                    static_cast<std::uint8_t>(b / count)};
        }
    }
    return result;
}

}
