#pragma once

#include <PixVision/Matching/TemplateMatcher.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace Pix::Vision::Matching::Internal {

/// Counters of one search, printed when PIXVISION_MATCH_PROFILE is set
struct MatchTiming {
    const char* status = "empty_input";  // found | not_found | empty_input | no_scan_range
    double totalMs = 0.0;
    Rect2i zone;                         // search rectangle after clamping
    int32_t templWidth = 0;
    int32_t templHeight = 0;
    size_t opaque = 0;
    int64_t candidates = 0;              // positions visited
    int64_t comparisons = 0;             // opaque pixels compared, over all positions
};

/// PIXVISION_MATCH_PROFILE set, non-empty and not starting with '0'; read once
PIXVISION_API bool IsMatchProfileEnabled();

/// "[TemplateMatchTiming] status=... total=...ms | search=... candidates=N comparisons=N"
PIXVISION_API std::string FormatMatchTiming(const MatchTiming& timing);

/// Print the formatted line (with newline) to stdout
PIXVISION_API void PrintMatchTiming(const MatchTiming& timing);

/// FindTemplateModel without the profiling output; fills all of timing but totalMs
PIXVISION_API std::optional<Rect2i> SearchTemplateModel(
    const PImage& source,
    const TemplateModel& model,
    const Rect2i& searchRect,
    const MatchParams& params,
    MatchTiming& timing
);

} // namespace Pix::Vision::Matching::Internal
