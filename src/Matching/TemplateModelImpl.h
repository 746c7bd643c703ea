#pragma once

#include <PixVision/Matching/TemplateMatcher.h>

#include <vector>

namespace Pix::Vision::Matching::Internal {

/// Opaque template pixel with its position, in raster order
struct OpaqueEntry {
    int32_t x = 0;
    int32_t y = 0;
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

class TemplateModelImpl {
public:
    TemplateModelImpl() = default;
    ~TemplateModelImpl() = default;

    TemplateModelImpl(const TemplateModelImpl&) = default;
    TemplateModelImpl& operator=(const TemplateModelImpl&) = default;
    TemplateModelImpl(TemplateModelImpl&&) noexcept = default;
    TemplateModelImpl& operator=(TemplateModelImpl&&) noexcept = default;

    void Clear();
    void Build(const PImage& templ);
    bool IsValid() const { return valid_; }

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }

    const std::vector<MaskedPixel>& Pixels() const { return pixels_; }
    const std::vector<OpaqueEntry>& Opaque() const { return opaque_; }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<MaskedPixel> pixels_;
    std::vector<OpaqueEntry> opaque_;   // wildcards always pass, never stored
    bool valid_ = false;
};

} // namespace Pix::Vision::Matching::Internal
