#pragma once

/**
 * @file PImage.h
 * @brief RGBA8 image container
 */

#include <PixVision/Core/Types.h>
#include <PixVision/Core/Export.h>

#include <cstddef>
#include <memory>

namespace Pix::Vision {

/**
 * @brief RGBA image with flat row-major storage
 *
 * Key features:
 * - Always 4 x 8-bit channels (RGBA); other layouts are converted on import
 * - Contiguous rows without padding (stride == width pixels)
 * - Shallow copy by default, Clone() for deep copy
 */
class PIXVISION_API PImage {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    PImage();

    /// Create image with specified dimensions, zero-filled (transparent black)
    PImage(int32_t width, int32_t height);

    /// Create image with specified dimensions filled with one colour
    PImage(int32_t width, int32_t height, const Rgba8& fill);

    /// Copy constructor (shallow copy)
    PImage(const PImage& other);

    /// Move constructor
    PImage(PImage&& other) noexcept;

    /// Destructor
    ~PImage();

    /// Copy assignment (shallow copy)
    PImage& operator=(const PImage& other);

    /// Move assignment
    PImage& operator=(PImage&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Create from interleaved raw data (copies data)
     *
     * @param data        First byte of the top row
     * @param width       Width in pixels
     * @param height      Height in pixels
     * @param channels    Source layout, expanded to RGBA (missing alpha = 255)
     * @param strideBytes Bytes between rows (0 = tightly packed)
     */
    static PImage FromData(const void* data, int32_t width, int32_t height,
                           ChannelType channels = ChannelType::RGBA,
                           size_t strideBytes = 0);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    /// Image width in pixels
    int32_t Width() const;

    /// Image height in pixels
    int32_t Height() const;

    /// Image size
    Size2i Size() const;

    /// Full image rectangle (0, 0, width, height)
    Rect2i Bounds() const;

    /// Row stride in pixels (always equals Width())
    size_t Stride() const;

    /// Check if image is empty
    bool Empty() const;

    /// Check if image is valid (allocated)
    bool IsValid() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get pointer to first pixel
    Rgba8* Data();
    const Rgba8* Data() const;

    /// Get pointer to specific row (no bounds check)
    Rgba8* RowPtr(int32_t row);
    const Rgba8* RowPtr(int32_t row) const;

    /// Get pixel at (x, y)
    /// @throws OutOfRangeException if (x, y) lies outside the image
    Rgba8 At(int32_t x, int32_t y) const;

    /// Set pixel at (x, y)
    /// @throws OutOfRangeException if (x, y) lies outside the image
    void SetAt(int32_t x, int32_t y, const Rgba8& value);

    /// Set every pixel to one colour
    void Fill(const Rgba8& value);

    // =========================================================================
    // Image Operations
    // =========================================================================

    /// Deep copy
    PImage Clone() const;

    /**
     * @brief Copy a rectangular region into a new image
     *
     * The rectangle is intersected with the image bounds first; an empty
     * intersection gives an empty image.
     */
    PImage Crop(const Rect2i& rect) const;

    /**
     * @brief Copy all pixels of src into this image with top-left at (x, y)
     *
     * Pixels falling outside this image are dropped. Alpha is copied, not
     * blended.
     */
    void Paste(const PImage& src, int32_t x, int32_t y);

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Pix::Vision
