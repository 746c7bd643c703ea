#include <PixVision/Core/PImage.h>
#include <PixVision/Core/Exception.h>
#include <PixVision/Core/Validate.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace Pix::Vision {

// =============================================================================
// Implementation class
// =============================================================================

class PImage::Impl {
public:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<Rgba8> pixels_;

    void Allocate(int32_t w, int32_t h, const Rgba8& fill) {
        width_ = w;
        height_ = h;
        pixels_.assign(static_cast<size_t>(w) * static_cast<size_t>(h), fill);
    }

    bool InBounds(int32_t x, int32_t y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    size_t Index(int32_t x, int32_t y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) +
               static_cast<size_t>(x);
    }
};

namespace {

std::string CoordText(int32_t x, int32_t y, int32_t w, int32_t h) {
    return "(" + std::to_string(x) + ", " + std::to_string(y) +
           ") not in " + std::to_string(w) + "x" + std::to_string(h) + " image";
}

// Expand one interleaved source pixel to RGBA
inline Rgba8 ExpandPixel(const uint8_t* p, ChannelType channels) {
    switch (channels) {
        case ChannelType::Gray:      return Rgba8(p[0], p[0], p[0]);
        case ChannelType::GrayAlpha: return Rgba8(p[0], p[0], p[0], p[1]);
        case ChannelType::RGB:       return Rgba8(p[0], p[1], p[2]);
        case ChannelType::BGR:       return Rgba8(p[2], p[1], p[0]);
        case ChannelType::RGBA:      return Rgba8(p[0], p[1], p[2], p[3]);
        case ChannelType::BGRA:      return Rgba8(p[2], p[1], p[0], p[3]);
    }
    return Rgba8();
}

} // anonymous namespace

// =============================================================================
// Constructors
// =============================================================================

PImage::PImage() : impl_(std::make_shared<Impl>()) {}

PImage::PImage(int32_t width, int32_t height)
    : PImage(width, height, Rgba8(0, 0, 0, ALPHA_TRANSPARENT)) {}

PImage::PImage(int32_t width, int32_t height, const Rgba8& fill)
    : impl_(std::make_shared<Impl>())
{
    Validate::RequireNonNegative(width, "width", "PImage");
    Validate::RequireNonNegative(height, "height", "PImage");

    impl_->Allocate(width, height, fill);
}

PImage::PImage(const PImage& other) = default;
PImage::PImage(PImage&& other) noexcept = default;
PImage::~PImage() = default;
PImage& PImage::operator=(const PImage& other) = default;
PImage& PImage::operator=(PImage&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

PImage PImage::FromData(const void* data, int32_t width, int32_t height,
                        ChannelType channels, size_t strideBytes) {
    PImage img(width, height);
    if (img.Empty()) {
        return img;
    }
    if (data == nullptr) {
        throw InvalidArgumentException("FromData: data is null");
    }

    size_t bpp = static_cast<size_t>(ChannelCount(channels));
    size_t packedStride = static_cast<size_t>(width) * bpp;
    if (strideBytes == 0) {
        strideBytes = packedStride;
    } else if (strideBytes < packedStride) {
        throw InvalidArgumentException(
            "FromData: stride " + std::to_string(strideBytes) +
            " is smaller than row size " + std::to_string(packedStride));
    }

    const uint8_t* src = static_cast<const uint8_t*>(data);
    for (int32_t y = 0; y < height; ++y) {
        const uint8_t* srcRow = src + static_cast<size_t>(y) * strideBytes;
        Rgba8* dstRow = img.RowPtr(y);

        if (channels == ChannelType::RGBA) {
            std::memcpy(dstRow, srcRow, packedStride);
            continue;
        }
        for (int32_t x = 0; x < width; ++x) {
            dstRow[x] = ExpandPixel(srcRow + static_cast<size_t>(x) * bpp, channels);
        }
    }

    return img;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t PImage::Width() const { return impl_->width_; }
int32_t PImage::Height() const { return impl_->height_; }
Size2i PImage::Size() const { return Size2i(impl_->width_, impl_->height_); }
Rect2i PImage::Bounds() const { return Rect2i(0, 0, impl_->width_, impl_->height_); }
size_t PImage::Stride() const { return static_cast<size_t>(impl_->width_); }
bool PImage::Empty() const { return impl_->width_ == 0 || impl_->height_ == 0; }
bool PImage::IsValid() const { return !Empty() && !impl_->pixels_.empty(); }

// =============================================================================
// Data Access
// =============================================================================

Rgba8* PImage::Data() { return impl_->pixels_.data(); }
const Rgba8* PImage::Data() const { return impl_->pixels_.data(); }

Rgba8* PImage::RowPtr(int32_t row) {
    return impl_->pixels_.data() + static_cast<size_t>(row) * Stride();
}

const Rgba8* PImage::RowPtr(int32_t row) const {
    return impl_->pixels_.data() + static_cast<size_t>(row) * Stride();
}

Rgba8 PImage::At(int32_t x, int32_t y) const {
    if (!impl_->InBounds(x, y)) {
        throw OutOfRangeException(
            "At(): " + CoordText(x, y, impl_->width_, impl_->height_));
    }
    return impl_->pixels_[impl_->Index(x, y)];
}

void PImage::SetAt(int32_t x, int32_t y, const Rgba8& value) {
    if (!impl_->InBounds(x, y)) {
        throw OutOfRangeException(
            "SetAt(): " + CoordText(x, y, impl_->width_, impl_->height_));
    }
    impl_->pixels_[impl_->Index(x, y)] = value;
}

void PImage::Fill(const Rgba8& value) {
    std::fill(impl_->pixels_.begin(), impl_->pixels_.end(), value);
}

// =============================================================================
// Image Operations
// =============================================================================

PImage PImage::Clone() const {
    PImage copy;
    copy.impl_->width_ = impl_->width_;
    copy.impl_->height_ = impl_->height_;
    copy.impl_->pixels_ = impl_->pixels_;
    return copy;
}

PImage PImage::Crop(const Rect2i& rect) const {
    Rect2i area = IntersectRect(rect, Bounds());
    if (area.Empty()) {
        return PImage();
    }

    PImage out(area.width, area.height);
    size_t rowBytes = static_cast<size_t>(area.width) * sizeof(Rgba8);
    for (int32_t y = 0; y < area.height; ++y) {
        std::memcpy(out.RowPtr(y), RowPtr(area.y + y) + area.x, rowBytes);
    }
    return out;
}

void PImage::Paste(const PImage& src, int32_t x, int32_t y) {
    Rect2i area = IntersectRect(Rect2i(x, y, src.Width(), src.Height()), Bounds());
    if (area.Empty()) {
        return;
    }

    int32_t srcX = area.x - x;
    int32_t srcY = area.y - y;
    size_t rowBytes = static_cast<size_t>(area.width) * sizeof(Rgba8);

    // src may share storage with this image; copy away from the overlap
    if (y <= 0) {
        for (int32_t row = 0; row < area.height; ++row) {
            std::memmove(RowPtr(area.y + row) + area.x,
                         src.RowPtr(srcY + row) + srcX, rowBytes);
        }
    } else {
        for (int32_t row = area.height - 1; row >= 0; --row) {
            std::memmove(RowPtr(area.y + row) + area.x,
                         src.RowPtr(srcY + row) + srcX, rowBytes);
        }
    }
}

} // namespace Pix::Vision
