#include <PixVision/Matching/TemplateMatcher.h>
#include <PixVision/Core/Exception.h>
#include <PixVision/Core/Validate.h>
#include <PixVision/Platform/Timer.h>

#include "MatchTiming.h"
#include "TemplateModelImpl.h"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace Pix::Vision::Matching {

namespace {

inline uint8_t AbsDiff(uint8_t a, uint8_t b) {
    return a > b ? static_cast<uint8_t>(a - b) : static_cast<uint8_t>(b - a);
}

// passTable[d] == CompareColorChannel(0, d, threshold), built with the same
// float arithmetic so the table and the scalar rule can never disagree
std::array<bool, 256> BuildPassTable(float threshold) {
    std::array<bool, 256> table{};
    for (int d = 0; d < 256; ++d) {
        table[static_cast<size_t>(d)] =
            CompareColorChannel(0, static_cast<uint8_t>(d), threshold);
    }
    return table;
}

} // anonymous namespace

// =============================================================================
// TemplateModelImpl
// =============================================================================

namespace Internal {

void TemplateModelImpl::Clear() {
    width_ = 0;
    height_ = 0;
    pixels_.clear();
    opaque_.clear();
    valid_ = false;
}

void TemplateModelImpl::Build(const PImage& templ) {
    Clear();
    if (templ.Empty()) {
        return;
    }

    width_ = templ.Width();
    height_ = templ.Height();
    pixels_.reserve(static_cast<size_t>(templ.Size().Area()));

    for (int32_t y = 0; y < height_; ++y) {
        const Rgba8* row = templ.RowPtr(y);
        for (int32_t x = 0; x < width_; ++x) {
            MaskedPixel px = MaskedPixel::FromRgba(row[x]);
            pixels_.push_back(px);
            if (px.IsOpaque()) {
                OpaqueEntry entry;
                entry.x = x;
                entry.y = y;
                entry.r = px.R();
                entry.g = px.G();
                entry.b = px.B();
                opaque_.push_back(entry);
            }
        }
    }
    valid_ = true;
}

bool IsMatchProfileEnabled() {
    static const bool enabled = [] {
        const char* env = std::getenv("PIXVISION_MATCH_PROFILE");
        return !(env == nullptr || env[0] == '\0' || env[0] == '0');
    }();
    return enabled;
}

std::string FormatMatchTiming(const MatchTiming& timing) {
    char buf[320];
    std::snprintf(buf, sizeof(buf),
                  "[TemplateMatchTiming] status=%s total=%.3fms | "
                  "search=%dx%d@(%d,%d) template=%dx%d opaque=%zu "
                  "candidates=%lld comparisons=%lld",
                  timing.status,
                  timing.totalMs,
                  timing.zone.width, timing.zone.height, timing.zone.x, timing.zone.y,
                  timing.templWidth, timing.templHeight,
                  timing.opaque,
                  static_cast<long long>(timing.candidates),
                  static_cast<long long>(timing.comparisons));
    return buf;
}

void PrintMatchTiming(const MatchTiming& timing) {
    std::printf("%s\n", FormatMatchTiming(timing).c_str());
}

} // namespace Internal

// =============================================================================
// TemplateModel
// =============================================================================

TemplateModel::TemplateModel()
    : impl_(std::make_unique<Internal::TemplateModelImpl>()) {}

TemplateModel::~TemplateModel() = default;

TemplateModel::TemplateModel(const TemplateModel& other)
    : impl_(other.impl_ ? std::make_unique<Internal::TemplateModelImpl>(*other.impl_)
                        : std::make_unique<Internal::TemplateModelImpl>()) {}

TemplateModel::TemplateModel(TemplateModel&& other) noexcept = default;

TemplateModel& TemplateModel::operator=(const TemplateModel& other) {
    if (this != &other) {
        impl_ = other.impl_ ? std::make_unique<Internal::TemplateModelImpl>(*other.impl_)
                            : std::make_unique<Internal::TemplateModelImpl>();
    }
    return *this;
}

TemplateModel& TemplateModel::operator=(TemplateModel&& other) noexcept = default;

bool TemplateModel::IsValid() const { return impl_ && impl_->IsValid(); }
int32_t TemplateModel::Width() const { return impl_ ? impl_->Width() : 0; }
int32_t TemplateModel::Height() const { return impl_ ? impl_->Height() : 0; }
Size2i TemplateModel::Size() const { return Size2i(Width(), Height()); }

int64_t TemplateModel::OpaqueCount() const {
    return impl_ ? static_cast<int64_t>(impl_->Opaque().size()) : 0;
}

int64_t TemplateModel::WildcardCount() const {
    return Size().Area() - OpaqueCount();
}

MaskedPixel TemplateModel::At(int32_t x, int32_t y) const {
    if (x < 0 || y < 0 || x >= Width() || y >= Height()) {
        throw OutOfRangeException(
            "TemplateModel::At(): (" + std::to_string(x) + ", " +
            std::to_string(y) + ") not in " + std::to_string(Width()) + "x" +
            std::to_string(Height()) + " template");
    }
    return impl_->Pixels()[static_cast<size_t>(y) * static_cast<size_t>(Width()) +
                           static_cast<size_t>(x)];
}

// =============================================================================
// Comparison Rules
// =============================================================================

float ClampThreshold(float threshold) {
    // NaN passes through and then fails every ">= threshold" test
    return std::clamp(threshold, MIN_THRESHOLD, MAX_THRESHOLD);
}

bool CompareColorChannel(uint8_t channel1, uint8_t channel2, float threshold) {
    threshold = ClampThreshold(threshold);
    float maxVal = static_cast<float>(std::max(channel1, channel2));
    float minVal = static_cast<float>(std::min(channel1, channel2));

    return (1.0f - ((maxVal - minVal) / 255.0f)) >= threshold;
}

bool CompareColors(const MaskedPixel& templatePixel, const Rgba8& sourcePixel,
                   float threshold) {
    if (templatePixel.IsWildcard()) {
        return true;
    }
    return CompareColorChannel(templatePixel.R(), sourcePixel.r, threshold) &&
           CompareColorChannel(templatePixel.G(), sourcePixel.g, threshold) &&
           CompareColorChannel(templatePixel.B(), sourcePixel.b, threshold);
}

bool CompareColors(const Rgba8& templatePixel, const Rgba8& sourcePixel,
                   float threshold) {
    return CompareColors(MaskedPixel::FromRgba(templatePixel), sourcePixel, threshold);
}

// =============================================================================
// Search
// =============================================================================

Rect2i ClampSearchRect(const Rect2i& searchRect,
                       int32_t sourceWidth, int32_t sourceHeight) {
    int64_t x = searchRect.x;
    int64_t y = searchRect.y;
    int64_t width = std::max<int64_t>(searchRect.width, 0);
    int64_t height = std::max<int64_t>(searchRect.height, 0);

    if (x < 0) {
        width = std::max<int64_t>(width + x, 0);
        x = 0;
    }
    if (y < 0) {
        height = std::max<int64_t>(height + y, 0);
        y = 0;
    }

    if (x + width > sourceWidth) {
        width = std::max<int64_t>(sourceWidth - x, 0);
    }
    if (y + height > sourceHeight) {
        height = std::max<int64_t>(sourceHeight - y, 0);
    }

    return Rect2i(static_cast<int32_t>(x), static_cast<int32_t>(y),
                  static_cast<int32_t>(width), static_cast<int32_t>(height));
}

void CreateTemplateModel(const PImage& templ, TemplateModel& model) {
    model = TemplateModel();
    PIXVISION_REQUIRE_IMAGE_VOID(templ);

    model.Impl()->Build(templ);
}

std::optional<Rect2i> FindTemplateModel(
    const PImage& source,
    const TemplateModel& model,
    const MatchParams& params)
{
    return FindTemplateModel(source, model, source.Bounds(), params);
}

std::optional<Rect2i> Internal::SearchTemplateModel(
    const PImage& source,
    const TemplateModel& model,
    const Rect2i& searchRect,
    const MatchParams& params,
    MatchTiming& timing)
{
    timing = MatchTiming();
    timing.zone = searchRect;
    timing.templWidth = model.Width();
    timing.templHeight = model.Height();

    PIXVISION_REQUIRE_IMAGE_OR(source, std::nullopt);
    if (!model.IsValid()) {
        return std::nullopt;
    }

    const Internal::TemplateModelImpl& impl = *model.Impl();
    const Rect2i zone = ClampSearchRect(searchRect, source.Width(), source.Height());
    timing.zone = zone;
    timing.opaque = impl.Opaque().size();

    // Exclusive candidate bounds. The default keeps the historical
    // "- template - 1" end, which leaves the last fitting positions unscanned.
    const int64_t slack = params.includeLastPosition ? 1 : -1;
    const int64_t xEnd = static_cast<int64_t>(zone.x) + zone.width - impl.Width() + slack;
    const int64_t yEnd = static_cast<int64_t>(zone.y) + zone.height - impl.Height() + slack;

    if (xEnd <= zone.x || yEnd <= zone.y) {
        timing.status = "no_scan_range";
        return std::nullopt;
    }

    const std::array<bool, 256> pass = BuildPassTable(params.threshold);
    const std::vector<Internal::OpaqueEntry>& opaque = impl.Opaque();

    // Offsets of opaque pixels relative to the candidate's top-left pixel
    const size_t stride = source.Stride();
    std::vector<size_t> offsets(opaque.size());
    for (size_t i = 0; i < opaque.size(); ++i) {
        offsets[i] = static_cast<size_t>(opaque[i].y) * stride +
                     static_cast<size_t>(opaque[i].x);
    }

    const Rgba8* data = source.Data();
    const size_t count = opaque.size();

    for (int32_t sY = zone.y; sY < yEnd; ++sY) {
        for (int32_t sX = zone.x; sX < xEnd; ++sX) {
            const Rgba8* origin = data + static_cast<size_t>(sY) * stride +
                                  static_cast<size_t>(sX);
            ++timing.candidates;

            bool maybeFound = true;
            size_t i = 0;
            for (; i < count; ++i) {
                const Internal::OpaqueEntry& t = opaque[i];
                const Rgba8& s = origin[offsets[i]];
                if (!pass[AbsDiff(t.r, s.r)] ||
                    !pass[AbsDiff(t.g, s.g)] ||
                    !pass[AbsDiff(t.b, s.b)]) {
                    maybeFound = false;
                    ++i;
                    break;
                }
            }
            timing.comparisons += static_cast<int64_t>(i);

            if (maybeFound) {
                timing.status = "found";
                return Rect2i(sX, sY, impl.Width(), impl.Height());
            }
        }
    }

    timing.status = "not_found";
    return std::nullopt;
}

std::optional<Rect2i> FindTemplateModel(
    const PImage& source,
    const TemplateModel& model,
    const Rect2i& searchRect,
    const MatchParams& params)
{
    Platform::Timer timer(true);
    Internal::MatchTiming timing;
    std::optional<Rect2i> hit =
        Internal::SearchTemplateModel(source, model, searchRect, params, timing);

    if (Internal::IsMatchProfileEnabled()) {
        timing.totalMs = timer.ElapsedMs();
        Internal::PrintMatchTiming(timing);
    }
    return hit;
}

std::optional<Rect2i> FindTemplate(
    const PImage& source,
    const PImage& templ,
    const MatchParams& params)
{
    return FindTemplate(source, templ, source.Bounds(), params);
}

std::optional<Rect2i> FindTemplate(
    const PImage& source,
    const PImage& templ,
    const Rect2i& searchRect,
    const MatchParams& params)
{
    TemplateModel model;
    CreateTemplateModel(templ, model);
    return FindTemplateModel(source, model, searchRect, params);
}

} // namespace Pix::Vision::Matching
