#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for PixVision
 */

#include <cstdint>
#include <PixVision/Core/Export.h>

namespace Pix::Vision {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Memory layouts accepted when importing raw pixel data
 *
 * PImage itself always stores RGBA; other layouts are expanded on import.
 */
enum class ChannelType {
    Gray,       ///< 1 channel grayscale
    GrayAlpha,  ///< 2 channels grayscale + alpha
    RGB,        ///< 3 channels RGB
    BGR,        ///< 3 channels BGR
    RGBA,       ///< 4 channels RGBA
    BGRA        ///< 4 channels BGRA (Windows DIB / screen capture order)
};

/// Number of interleaved bytes per pixel for a channel layout
inline int ChannelCount(ChannelType type) {
    switch (type) {
        case ChannelType::Gray:      return 1;
        case ChannelType::GrayAlpha: return 2;
        case ChannelType::RGB:
        case ChannelType::BGR:       return 3;
        case ChannelType::RGBA:
        case ChannelType::BGRA:      return 4;
    }
    return 4;
}

/// Alpha value treated as fully opaque
constexpr uint8_t ALPHA_OPAQUE = 255;

/// Alpha value treated as fully transparent
constexpr uint8_t ALPHA_TRANSPARENT = 0;

/**
 * @brief 8-bit RGBA pixel
 */
struct PIXVISION_API Rgba8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = ALPHA_OPAQUE;

    Rgba8() = default;
    Rgba8(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = ALPHA_OPAQUE)
        : r(r_), g(g_), b(b_), a(a_) {}

    bool operator==(const Rgba8& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Rgba8& other) const { return !(*this == other); }
};

static_assert(sizeof(Rgba8) == 4, "Rgba8 must be tightly packed");

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point with integer coordinates
 */
struct PIXVISION_API Point2i {
    int32_t x = 0;
    int32_t y = 0;

    Point2i() = default;
    Point2i(int32_t x_, int32_t y_) : x(x_), y(y_) {}

    bool operator==(const Point2i& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2i& other) const { return !(*this == other); }
};

// =============================================================================
// Size Type
// =============================================================================

/**
 * @brief 2D size with integer dimensions
 */
struct PIXVISION_API Size2i {
    int32_t width = 0;
    int32_t height = 0;

    Size2i() = default;
    Size2i(int32_t w, int32_t h) : width(w), height(h) {}

    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool IsValid() const { return width >= 0 && height >= 0; }

    bool operator==(const Size2i& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size2i& other) const { return !(*this == other); }
};

// =============================================================================
// Rectangle Type
// =============================================================================

/**
 * @brief Axis-aligned rectangle with integer coordinates
 */
struct PIXVISION_API Rect2i {
    int32_t x = 0;      ///< Left
    int32_t y = 0;      ///< Top
    int32_t width = 0;
    int32_t height = 0;

    Rect2i() = default;
    Rect2i(int32_t x_, int32_t y_, int32_t w, int32_t h)
        : x(x_), y(y_), width(w), height(h) {}
    Rect2i(const Point2i& origin, const Size2i& size)
        : x(origin.x), y(origin.y), width(size.width), height(size.height) {}

    /// Exclusive right/bottom edges, widened so x + width cannot overflow
    int64_t Right() const { return static_cast<int64_t>(x) + width; }
    int64_t Bottom() const { return static_cast<int64_t>(y) + height; }
    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    Point2i TopLeft() const { return {x, y}; }
    Size2i Size() const { return {width, height}; }
    bool IsValid() const { return width >= 0 && height >= 0; }
    bool Empty() const { return width <= 0 || height <= 0; }

    bool Contains(int32_t px, int32_t py) const {
        return px >= x && px < Right() && py >= y && py < Bottom();
    }

    bool Contains(const Point2i& p) const {
        return Contains(p.x, p.y);
    }

    bool operator==(const Rect2i& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
    bool operator!=(const Rect2i& other) const { return !(*this == other); }
};

/**
 * @brief Intersection of two rectangles
 * @return Overlapping area, or a zero-sized rectangle when they are disjoint
 */
PIXVISION_API Rect2i IntersectRect(const Rect2i& a, const Rect2i& b);

} // namespace Pix::Vision
