#include <PixVision/IO/ImageIO.h>
#include <PixVision/Core/Exception.h>
#include <PixVision/Core/Validate.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <memory>
#include <string>
#include <utility>

// stb_image for file I/O
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Pix::Vision::IO {

namespace {

struct StbiDeleter {
    void operator()(stbi_uc* p) const { stbi_image_free(p); }
};

using StbiPixels = std::unique_ptr<stbi_uc, StbiDeleter>;

std::string FailureReason() {
    const char* reason = stbi_failure_reason();
    return reason ? reason : "unknown error";
}

std::string LowerExtension(const std::string& filename) {
    size_t dot = filename.find_last_of('.');
    size_t slash = filename.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// Writable format for an extension; unknown and read-only ones become PNG
ImageFormat ResolveWriteFormat(const std::string& filename) {
    switch (GetFormatFromFilename(filename)) {
        case ImageFormat::JPEG: return ImageFormat::JPEG;
        case ImageFormat::BMP:  return ImageFormat::BMP;
        case ImageFormat::TGA:  return ImageFormat::TGA;
        default:                return ImageFormat::PNG;
    }
}

PImage FromStbPixels(StbiPixels pixels, int w, int h) {
    // Requested 4 components, so the buffer is tightly packed RGBA
    return PImage::FromData(pixels.get(), w, h, ChannelType::RGBA);
}

} // anonymous namespace

// =============================================================================
// Image Read Functions
// =============================================================================

void ReadImage(const std::string& filename, PImage& image) {
    int w = 0, h = 0, channels = 0;
    StbiPixels pixels(stbi_load(filename.c_str(), &w, &h, &channels, STBI_rgb_alpha));

    if (!pixels) {
        throw IOException("Failed to load image: " + filename + " (" + FailureReason() + ")");
    }

    image = FromStbPixels(std::move(pixels), w, h);
}

void ReadImageFromMemory(const void* data, size_t size, PImage& image) {
    if (data == nullptr || size == 0) {
        throw InvalidArgumentException("ReadImageFromMemory: buffer is empty");
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        throw UnsupportedException("ReadImageFromMemory: buffer larger than 2 GiB");
    }

    int w = 0, h = 0, channels = 0;
    StbiPixels pixels(stbi_load_from_memory(static_cast<const stbi_uc*>(data),
                                            static_cast<int>(size),
                                            &w, &h, &channels, STBI_rgb_alpha));
    if (!pixels) {
        throw IOException("Failed to decode image buffer (" + FailureReason() + ")");
    }

    image = FromStbPixels(std::move(pixels), w, h);
}

// =============================================================================
// Image Write Functions
// =============================================================================

bool WriteImage(const PImage& image, const std::string& filename) {
    return WriteImage(image, filename, ImageFormat::Auto);
}

bool WriteImage(const PImage& image, const std::string& filename,
                ImageFormat format, int jpegQuality) {
    Validate::RequireImageNonEmpty(image, "WriteImage");
    PIXVISION_REQUIRE_RANGE(jpegQuality, 1, 100);

    if (format == ImageFormat::Auto) {
        format = ResolveWriteFormat(filename);
    }

    const int w = image.Width();
    const int h = image.Height();
    const void* data = image.Data();
    const int strideBytes = w * static_cast<int>(sizeof(Rgba8));

    switch (format) {
        case ImageFormat::PNG:
            return stbi_write_png(filename.c_str(), w, h, 4, data, strideBytes) != 0;
        case ImageFormat::JPEG:
            return stbi_write_jpg(filename.c_str(), w, h, 4, data, jpegQuality) != 0;
        case ImageFormat::BMP:
            return stbi_write_bmp(filename.c_str(), w, h, 4, data) != 0;
        case ImageFormat::TGA:
            return stbi_write_tga(filename.c_str(), w, h, 4, data) != 0;
        case ImageFormat::GIF:
        case ImageFormat::PSD:
        case ImageFormat::PNM:
        case ImageFormat::Auto:
            break;
    }
    throw UnsupportedException("WriteImage: format is read-only: " + filename);
}

// =============================================================================
// Cropping
// =============================================================================

void CropImage(const PImage& image, const Rect2i& rect, PImage& cropped) {
    cropped = image.Crop(rect);
}

// =============================================================================
// Format Utilities
// =============================================================================

ImageFormat GetFormatFromFilename(const std::string& filename) {
    const std::string ext = LowerExtension(filename);
    if (ext == "png") return ImageFormat::PNG;
    if (ext == "jpg" || ext == "jpeg") return ImageFormat::JPEG;
    if (ext == "bmp") return ImageFormat::BMP;
    if (ext == "tga") return ImageFormat::TGA;
    if (ext == "gif") return ImageFormat::GIF;
    if (ext == "psd") return ImageFormat::PSD;
    if (ext == "pgm" || ext == "ppm" || ext == "pnm") return ImageFormat::PNM;
    return ImageFormat::Auto;
}

bool FormatSupportsAlpha(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:
        case ImageFormat::TGA:
        case ImageFormat::GIF:
        case ImageFormat::PSD:
            return true;
        default:
            return false;
    }
}

} // namespace Pix::Vision::IO
