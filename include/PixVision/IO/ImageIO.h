#pragma once

/**
 * @file ImageIO.h
 * @brief Image file I/O and cropping
 *
 * Decoding/encoding is backed by stb_image / stb_image_write. Every decoded
 * image is expanded to RGBA; gray and RGB files get alpha 255 (fully opaque),
 * so only files that carry an alpha channel can mark template wildcards.
 *
 * Read formats:  PNG, JPEG, BMP, TGA, GIF (first frame), PSD, PNM
 * Write formats: PNG, JPEG, BMP, TGA
 */

#include <PixVision/Core/Export.h>
#include <PixVision/Core/PImage.h>
#include <PixVision/Core/Types.h>

#include <string>

namespace Pix::Vision::IO {

/**
 * @brief Supported image file formats
 */
enum class ImageFormat {
    Auto,       ///< Auto-detect from extension
    PNG,        ///< PNG (lossless, alpha)
    JPEG,       ///< JPEG (lossy, no alpha)
    BMP,        ///< BMP (uncompressed)
    TGA,        ///< TGA (lossless, alpha)
    GIF,        ///< GIF (read only)
    PSD,        ///< Photoshop composite (read only)
    PNM         ///< PGM/PPM (read only)
};

// =============================================================================
// Image Read Functions
// =============================================================================

/**
 * @brief Read image from file
 *
 * @param filename Input file path
 * @param[out] image Loaded RGBA image
 * @throws IOException if the file cannot be opened or decoded
 */
PIXVISION_API void ReadImage(const std::string& filename, PImage& image);

/**
 * @brief Decode image from an in-memory encoded buffer (e.g. a PNG blob)
 *
 * @throws IOException if the buffer cannot be decoded
 */
PIXVISION_API void ReadImageFromMemory(const void* data, size_t size, PImage& image);

// =============================================================================
// Image Write Functions
// =============================================================================

/**
 * @brief Write image to file, format chosen from the extension (PNG fallback)
 *
 * @return true on success
 * @throws InvalidArgumentException if image is empty
 */
PIXVISION_API bool WriteImage(const PImage& image, const std::string& filename);

/**
 * @brief Write image with explicit format
 *
 * @param jpegQuality JPEG quality [1, 100], ignored for other formats
 * @throws InvalidArgumentException if image is empty or quality out of range
 * @throws UnsupportedException for read-only formats
 */
PIXVISION_API bool WriteImage(const PImage& image, const std::string& filename,
                              ImageFormat format, int jpegQuality = 95);

// =============================================================================
// Cropping
// =============================================================================

/**
 * @brief Copy a rectangular region of an image
 *
 * Typical use: cut a template out of a reference screenshot, or cut the
 * matched area out of a source after FindTemplate.
 * The rectangle is clipped to the image; no overlap gives an empty result.
 */
PIXVISION_API void CropImage(const PImage& image, const Rect2i& rect, PImage& cropped);

// =============================================================================
// Format Utilities
// =============================================================================

/// Format implied by the file extension (case-insensitive), Auto if unknown
PIXVISION_API ImageFormat GetFormatFromFilename(const std::string& filename);

/// True if the format keeps an alpha channel when written
PIXVISION_API bool FormatSupportsAlpha(ImageFormat format);

} // namespace Pix::Vision::IO
