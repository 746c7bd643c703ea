/**
 * @file test_match_timing.cpp
 * @brief Search counters and the PIXVISION_MATCH_PROFILE output line
 */

#include <gtest/gtest.h>
#include <PixVision/Matching/TemplateMatcher.h>

#include "Matching/MatchTiming.h"

#include <string>

using namespace Pix::Vision;
using namespace Pix::Vision::Matching;
using Internal::MatchTiming;

namespace {

const Rgba8 kBackground(30, 30, 30);
const Rgba8 kRed(255, 0, 0);

TemplateModel MakeModel(const PImage& templ) {
    TemplateModel model;
    CreateTemplateModel(templ, model);
    return model;
}

} // anonymous namespace

// =============================================================================
// Counters
// =============================================================================

TEST(MatchTimingTest, FoundCountsVisitedPositionsAndPixels) {
    PImage source(20, 20, kBackground);
    source.Paste(PImage(3, 3, kRed), 5, 5);
    TemplateModel model = MakeModel(PImage(3, 3, kRed));

    MatchTiming timing;
    auto hit = Internal::SearchTemplateModel(source, model, source.Bounds(),
                                             MatchParams(), timing);
    ASSERT_TRUE(hit.has_value());

    // Rows 0-4 (16 positions each) plus x = 0..5 on row 5; every miss stops
    // at the first template pixel, the hit compares all 9
    EXPECT_STREQ(timing.status, "found");
    EXPECT_EQ(timing.zone, Rect2i(0, 0, 20, 20));
    EXPECT_EQ(timing.templWidth, 3);
    EXPECT_EQ(timing.templHeight, 3);
    EXPECT_EQ(timing.opaque, 9u);
    EXPECT_EQ(timing.candidates, 86);
    EXPECT_EQ(timing.comparisons, 94);
}

TEST(MatchTimingTest, NotFoundVisitsWholeScanRange) {
    PImage source(20, 20, kBackground);
    TemplateModel model = MakeModel(PImage(3, 3, kRed));

    MatchTiming timing;
    EXPECT_FALSE(Internal::SearchTemplateModel(source, model, source.Bounds(),
                                               MatchParams(), timing).has_value());
    EXPECT_STREQ(timing.status, "not_found");
    EXPECT_EQ(timing.candidates, 16 * 16);
    EXPECT_EQ(timing.comparisons, 16 * 16);
}

TEST(MatchTimingTest, SameSizeImagesHaveNoScanRange) {
    PImage source(10, 10, kRed);
    TemplateModel model = MakeModel(PImage(10, 10, kRed));

    MatchTiming timing;
    EXPECT_FALSE(Internal::SearchTemplateModel(source, model, Rect2i(-5, 0, 100, 100),
                                               MatchParams(), timing).has_value());
    EXPECT_STREQ(timing.status, "no_scan_range");
    EXPECT_EQ(timing.zone, Rect2i(0, 0, 10, 10));
    EXPECT_EQ(timing.candidates, 0);
    EXPECT_EQ(timing.comparisons, 0);
}

TEST(MatchTimingTest, EmptyInputs) {
    TemplateModel model = MakeModel(PImage(3, 3, kRed));
    MatchTiming timing;
    timing.status = "found";

    Internal::SearchTemplateModel(PImage(), model, Rect2i(0, 0, 5, 5), MatchParams(), timing);
    EXPECT_STREQ(timing.status, "empty_input");

    Internal::SearchTemplateModel(PImage(5, 5), TemplateModel(), Rect2i(0, 0, 5, 5),
                                  MatchParams(), timing);
    EXPECT_STREQ(timing.status, "empty_input");
    EXPECT_EQ(timing.candidates, 0);
}

TEST(MatchTimingTest, TransparentTemplateComparesNothing) {
    TemplateModel model = MakeModel(PImage(4, 4, Rgba8(0, 0, 0, 0)));
    MatchTiming timing;
    auto hit = Internal::SearchTemplateModel(PImage(20, 20, kBackground), model,
                                             Rect2i(3, 2, 10, 10), MatchParams(), timing);
    EXPECT_EQ(hit, Rect2i(3, 2, 4, 4));
    EXPECT_EQ(timing.opaque, 0u);
    EXPECT_EQ(timing.candidates, 1);
    EXPECT_EQ(timing.comparisons, 0);
}

// =============================================================================
// Output Line
// =============================================================================

TEST(MatchTimingTest, FormatLine) {
    MatchTiming timing;
    timing.status = "found";
    timing.totalMs = 0.035;
    timing.zone = Rect2i(0, 0, 20, 20);
    timing.templWidth = 3;
    timing.templHeight = 3;
    timing.opaque = 9;
    timing.candidates = 86;
    timing.comparisons = 94;

    EXPECT_EQ(Internal::FormatMatchTiming(timing),
              "[TemplateMatchTiming] status=found total=0.035ms | "
              "search=20x20@(0,0) template=3x3 opaque=9 candidates=86 comparisons=94");
}

TEST(MatchTimingTest, PrintedLineForNoScanRange) {
    PImage source(10, 10, kRed);
    TemplateModel model = MakeModel(PImage(10, 10, kRed));
    MatchTiming timing;
    Internal::SearchTemplateModel(source, model, source.Bounds(), MatchParams(), timing);

    ::testing::internal::CaptureStdout();
    Internal::PrintMatchTiming(timing);
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, Internal::FormatMatchTiming(timing) + "\n");
    EXPECT_EQ(out.rfind("[TemplateMatchTiming] status=no_scan_range total=", 0), 0u) << out;
    EXPECT_NE(out.find("search=10x10@(0,0) template=10x10 opaque=100 "
                       "candidates=0 comparisons=0\n"), std::string::npos) << out;
}

TEST(MatchTimingTest, PublicSearchAgreesWithCounters) {
    PImage source(20, 20, kBackground);
    source.Paste(PImage(3, 3, kRed), 5, 5);
    TemplateModel model = MakeModel(PImage(3, 3, kRed));

    MatchTiming timing;
    auto counted = Internal::SearchTemplateModel(source, model, source.Bounds(),
                                                 MatchParams(), timing);
    EXPECT_EQ(FindTemplateModel(source, model), counted);
}
