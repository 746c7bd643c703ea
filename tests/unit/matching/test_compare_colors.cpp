/**
 * @file test_compare_colors.cpp
 * @brief Channel/pixel comparison rules and threshold clamping
 */

#include <gtest/gtest.h>
#include <PixVision/Matching/TemplateMatcher.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace Pix::Vision;
using namespace Pix::Vision::Matching;

// =============================================================================
// ClampThreshold
// =============================================================================

TEST(ClampThresholdTest, InsideRangeUnchanged) {
    EXPECT_FLOAT_EQ(ClampThreshold(0.1f), 0.1f);
    EXPECT_FLOAT_EQ(ClampThreshold(0.5f), 0.5f);
    EXPECT_FLOAT_EQ(ClampThreshold(1.0f), 1.0f);
}

TEST(ClampThresholdTest, OutsideRangeClamped) {
    EXPECT_FLOAT_EQ(ClampThreshold(0.0f), MIN_THRESHOLD);
    EXPECT_FLOAT_EQ(ClampThreshold(-5.0f), MIN_THRESHOLD);
    EXPECT_FLOAT_EQ(ClampThreshold(1.5f), MAX_THRESHOLD);
    EXPECT_FLOAT_EQ(ClampThreshold(std::numeric_limits<float>::infinity()), MAX_THRESHOLD);
}

TEST(ClampThresholdTest, NanRejectsEveryChannel) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_TRUE(std::isnan(ClampThreshold(nan)));
    EXPECT_FALSE(CompareColorChannel(10, 11, nan));
    EXPECT_FALSE(CompareColorChannel(10, 10, nan));
    EXPECT_FALSE(CompareColors(Rgba8(10, 10, 10), Rgba8(10, 10, 10), nan));
    EXPECT_TRUE(CompareColors(Rgba8(10, 10, 10, 0), Rgba8(200, 0, 0), nan));
}

// =============================================================================
// CompareColorChannel
// =============================================================================

TEST(CompareColorChannelTest, ExactThresholdNeedsIdenticalValues) {
    EXPECT_TRUE(CompareColorChannel(0, 0, 1.0f));
    EXPECT_TRUE(CompareColorChannel(128, 128, 1.0f));
    EXPECT_TRUE(CompareColorChannel(255, 255, 1.0f));
    EXPECT_FALSE(CompareColorChannel(128, 129, 1.0f));
    EXPECT_FALSE(CompareColorChannel(0, 255, 1.0f));
}

TEST(CompareColorChannelTest, LowestThresholdAcceptsUpTo229) {
    // 1 - 229/255 = 0.102 >= 0.1, 1 - 230/255 = 0.098 < 0.1
    EXPECT_TRUE(CompareColorChannel(0, 229, 0.1f));
    EXPECT_FALSE(CompareColorChannel(0, 230, 0.1f));
    EXPECT_FALSE(CompareColorChannel(0, 255, 0.1f));
}

TEST(CompareColorChannelTest, DifferenceOfFiftyAtHalfThreshold) {
    // 1 - 50/255 ~= 0.80
    EXPECT_TRUE(CompareColorChannel(0, 50, 0.5f));
    EXPECT_TRUE(CompareColorChannel(0, 50, 0.8f));
    EXPECT_FALSE(CompareColorChannel(0, 50, 0.81f));
}

TEST(CompareColorChannelTest, IsSymmetric) {
    const std::vector<float> thresholds = {0.0f, 0.1f, 0.33f, 0.5f, 0.8f, 0.95f, 1.0f, 2.0f};
    for (float t : thresholds) {
        for (int a = 0; a < 256; a += 3) {
            for (int b = 0; b < 256; b += 5) {
                ASSERT_EQ(CompareColorChannel(static_cast<uint8_t>(a), static_cast<uint8_t>(b), t),
                          CompareColorChannel(static_cast<uint8_t>(b), static_cast<uint8_t>(a), t))
                    << "a=" << a << " b=" << b << " t=" << t;
            }
        }
    }
}

TEST(CompareColorChannelTest, ClampedThresholdsBehaveLikeBounds) {
    for (int d = 0; d < 256; ++d) {
        uint8_t v = static_cast<uint8_t>(d);
        ASSERT_EQ(CompareColorChannel(0, v, 0.0f), CompareColorChannel(0, v, 0.1f)) << d;
        ASSERT_EQ(CompareColorChannel(0, v, -1.0f), CompareColorChannel(0, v, 0.1f)) << d;
        ASSERT_EQ(CompareColorChannel(0, v, 1.01f), CompareColorChannel(0, v, 1.0f)) << d;
        ASSERT_EQ(CompareColorChannel(0, v, 100.0f), CompareColorChannel(0, v, 1.0f)) << d;
    }
}

TEST(CompareColorChannelTest, MonotonicInDifference) {
    const float t = 0.7f;
    bool seenFail = false;
    for (int d = 0; d < 256; ++d) {
        bool pass = CompareColorChannel(100, static_cast<uint8_t>(std::min(255, 100 + d)), t);
        if (!pass) {
            seenFail = true;
        }
        if (seenFail) {
            ASSERT_FALSE(pass) << "difference " << d << " passed after a smaller one failed";
        }
    }
    EXPECT_TRUE(seenFail);
}

// =============================================================================
// CompareColors
// =============================================================================

TEST(CompareColorsTest, TransparentTemplatePixelMatchesAnything) {
    EXPECT_TRUE(CompareColors(Rgba8(0, 0, 0, 0), Rgba8(255, 255, 255), 1.0f));
    EXPECT_TRUE(CompareColors(Rgba8(255, 0, 0, 200), Rgba8(0, 255, 0), 1.0f));
    EXPECT_TRUE(CompareColors(MaskedPixel::Wildcard(), Rgba8(1, 2, 3), 1.0f));
}

TEST(CompareColorsTest, OpaqueNeedsAllThreeChannels) {
    Rgba8 templ(100, 100, 100);
    EXPECT_TRUE(CompareColors(templ, Rgba8(100, 100, 100), 1.0f));
    EXPECT_FALSE(CompareColors(templ, Rgba8(101, 100, 100), 1.0f));
    EXPECT_FALSE(CompareColors(templ, Rgba8(100, 101, 100), 1.0f));
    EXPECT_FALSE(CompareColors(templ, Rgba8(100, 100, 101), 1.0f));
}

TEST(CompareColorsTest, SourceAlphaIsIgnored) {
    EXPECT_TRUE(CompareColors(Rgba8(5, 6, 7), Rgba8(5, 6, 7, 0), 1.0f));
}

TEST(CompareColorsTest, ToleranceAppliesPerChannel) {
    Rgba8 templ(100, 100, 100);
    EXPECT_TRUE(CompareColors(templ, Rgba8(150, 50, 125), 0.8f));
    EXPECT_FALSE(CompareColors(templ, Rgba8(150, 50, 160), 0.8f));
}

TEST(CompareColorsTest, MaskedAndRgbaOverloadsAgree) {
    const Rgba8 samples[] = {
        Rgba8(0, 0, 0), Rgba8(10, 200, 30), Rgba8(255, 255, 255, 254), Rgba8(90, 90, 90, 0)
    };
    for (const Rgba8& t : samples) {
        for (const Rgba8& s : samples) {
            for (float thr : {0.1f, 0.6f, 1.0f}) {
                EXPECT_EQ(CompareColors(t, s, thr),
                          CompareColors(MaskedPixel::FromRgba(t), s, thr));
            }
        }
    }
}
