#include <PixVision/Core/Types.h>

#include <algorithm>

namespace Pix::Vision {

// =============================================================================
// Rect2i Operations
// =============================================================================

Rect2i IntersectRect(const Rect2i& a, const Rect2i& b) {
    // 64-bit edges so x + width cannot overflow
    int64_t left = std::max<int64_t>(a.x, b.x);
    int64_t top = std::max<int64_t>(a.y, b.y);
    int64_t right = std::min<int64_t>(static_cast<int64_t>(a.x) + a.width,
                                      static_cast<int64_t>(b.x) + b.width);
    int64_t bottom = std::min<int64_t>(static_cast<int64_t>(a.y) + a.height,
                                       static_cast<int64_t>(b.y) + b.height);

    if (right <= left || bottom <= top) {
        return Rect2i(static_cast<int32_t>(left), static_cast<int32_t>(top), 0, 0);
    }
    return Rect2i(static_cast<int32_t>(left), static_cast<int32_t>(top),
                  static_cast<int32_t>(right - left),
                  static_cast<int32_t>(bottom - top));
}

} // namespace Pix::Vision
