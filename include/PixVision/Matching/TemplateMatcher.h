#pragma once

/**
 * @file TemplateMatcher.h
 * @brief Exhaustive per-pixel template search
 *
 * Finds the first position (raster order: rows top to bottom, columns left
 * to right) where every opaque template pixel is close enough to the source
 * pixel under it. Transparent template pixels are wildcards.
 *
 * No scale/rotation invariance and no multiple matches: the first hit wins.
 *
 * @code
 * PImage screen, button;
 * IO::ReadImage("screen.png", screen);
 * IO::ReadImage("button.png", button);
 *
 * MatchParams params;
 * params.threshold = 0.9f;
 * if (auto hit = FindTemplate(screen, button, params)) {
 *     // hit->x, hit->y, hit->width, hit->height
 * }
 * @endcode
 *
 * Set PIXVISION_MATCH_PROFILE=1 to print one timing line per search.
 */

#include <PixVision/Core/Export.h>
#include <PixVision/Core/PImage.h>
#include <PixVision/Core/Types.h>
#include <PixVision/Matching/MaskedPixel.h>

#include <cstdint>
#include <memory>
#include <optional>

namespace Pix::Vision::Matching {

namespace Internal {
class TemplateModelImpl;
}

/// Lowest accepted similarity threshold
constexpr float MIN_THRESHOLD = 0.1f;

/// Highest accepted similarity threshold (exact match)
constexpr float MAX_THRESHOLD = 1.0f;

/**
 * @brief Per-call search configuration
 */
struct PIXVISION_API MatchParams {
    /// Per-channel similarity in [0.1, 1.0]; out-of-range values are clamped.
    /// 1.0 = channels must be identical.
    float threshold = MAX_THRESHOLD;

    /// false: candidate range ends at (x + width - templateWidth - 1),
    ///        exclusive, which leaves out the last fitting columns/rows.
    ///        Kept so existing templates and search rectangles behave as before.
    /// true:  every position where the template fits is scanned.
    bool includeLastPosition = false;
};

/**
 * @brief Template converted once into masked pixels
 *
 * Reuse a model when the same template is searched in many frames.
 */
class PIXVISION_API TemplateModel {
public:
    TemplateModel();
    ~TemplateModel();
    TemplateModel(const TemplateModel& other);
    TemplateModel(TemplateModel&& other) noexcept;
    TemplateModel& operator=(const TemplateModel& other);
    TemplateModel& operator=(TemplateModel&& other) noexcept;

    /// True once created from a non-empty template
    bool IsValid() const;

    int32_t Width() const;
    int32_t Height() const;
    Size2i Size() const;

    /// Number of pixels that take part in comparison
    int64_t OpaqueCount() const;

    /// Number of pixels ignored during comparison
    int64_t WildcardCount() const;

    /// Masked pixel at template coordinate (x, y)
    /// @throws OutOfRangeException outside the template
    MaskedPixel At(int32_t x, int32_t y) const;

    Internal::TemplateModelImpl* Impl() { return impl_.get(); }
    const Internal::TemplateModelImpl* Impl() const { return impl_.get(); }

private:
    std::unique_ptr<Internal::TemplateModelImpl> impl_;
};

// =============================================================================
// Comparison Rules
// =============================================================================

/**
 * @brief Clamp threshold to [MIN_THRESHOLD, MAX_THRESHOLD]
 *
 * NaN is returned unchanged. No channel passes against a NaN threshold, so
 * only fully transparent templates can match.
 */
PIXVISION_API float ClampThreshold(float threshold);

/**
 * @brief Compare one colour channel
 *
 * similarity = 1 - |channel1 - channel2| / 255, passes if >= threshold.
 * At 1.0 only identical values pass; at 0.1 differences up to 229 pass.
 */
PIXVISION_API bool CompareColorChannel(uint8_t channel1, uint8_t channel2, float threshold);

/**
 * @brief Compare template pixel against source pixel
 *
 * Template alpha is collapsed first (255 = opaque, else wildcard). Wildcards
 * always match; opaque pixels need R, G and B to pass. Source alpha is ignored.
 */
PIXVISION_API bool CompareColors(const Rgba8& templatePixel, const Rgba8& sourcePixel,
                                 float threshold);

/// Same rule for an already collapsed template pixel
PIXVISION_API bool CompareColors(const MaskedPixel& templatePixel, const Rgba8& sourcePixel,
                                 float threshold);

// =============================================================================
// Search
// =============================================================================

/**
 * @brief Clamp search rectangle to the source image
 *
 * Width/height are shrunk so the rectangle ends inside the source; a
 * non-negative x/y is kept as given, even past the image. Deliberate
 * exception to "x/y are never shifted": a negative origin is moved to 0
 * and the size reduced by the same amount, since columns/rows left of or
 * above the image cannot be read. Sizes never go below zero.
 */
PIXVISION_API Rect2i ClampSearchRect(const Rect2i& searchRect,
                                     int32_t sourceWidth, int32_t sourceHeight);

/**
 * @brief Build a template model
 *
 * @param templ Template image (RGBA; alpha != 255 marks wildcards)
 * @param model [out] Model; left invalid when templ is empty
 */
PIXVISION_API void CreateTemplateModel(const PImage& templ, TemplateModel& model);

/**
 * @brief Search a prepared model in the whole source image
 */
PIXVISION_API std::optional<Rect2i> FindTemplateModel(
    const PImage& source,
    const TemplateModel& model,
    const MatchParams& params = MatchParams()
);

/**
 * @brief Search a prepared model inside a sub-rectangle of the source
 *
 * @param source     Image searched in
 * @param model      Template model
 * @param searchRect Region of source to scan, clamped to the image
 * @param params     Threshold and scan range mode
 * @return Template-sized rectangle at the first match, or nullopt
 */
PIXVISION_API std::optional<Rect2i> FindTemplateModel(
    const PImage& source,
    const TemplateModel& model,
    const Rect2i& searchRect,
    const MatchParams& params = MatchParams()
);

/**
 * @brief Find template in the whole source image
 *
 * @return Rectangle (position + template size) of the first match, or
 *         nullopt if no position matches or an input is empty
 */
PIXVISION_API std::optional<Rect2i> FindTemplate(
    const PImage& source,
    const PImage& templ,
    const MatchParams& params = MatchParams()
);

/**
 * @brief Find template inside a sub-rectangle of the source image
 *
 * Scanning a smaller area is the main way to speed up a search. More
 * distinctive templates are rejected sooner at non-matching positions and
 * therefore search faster too.
 */
PIXVISION_API std::optional<Rect2i> FindTemplate(
    const PImage& source,
    const PImage& templ,
    const Rect2i& searchRect,
    const MatchParams& params = MatchParams()
);

} // namespace Pix::Vision::Matching
