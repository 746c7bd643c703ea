#include <gtest/gtest.h>
#include <PixVision/Core/Validate.h>
#include <PixVision/Core/Exception.h>

#include <optional>
#include <string>

using namespace Pix::Vision;

namespace {

std::optional<int> WidthOrNothing(const PImage& image) {
    PIXVISION_REQUIRE_IMAGE_OR(image, std::nullopt);
    return image.Width();
}

void CheckThreshold(float threshold) {
    PIXVISION_REQUIRE_RANGE(threshold, 0.1f, 1.0f);
}

} // anonymous namespace

TEST(ValidateTest, EmptyImageIsSilentNoOp) {
    EXPECT_FALSE(Validate::RequireImageValid(PImage(), "Test"));
    EXPECT_FALSE(WidthOrNothing(PImage()).has_value());
}

TEST(ValidateTest, ValidImagePasses) {
    EXPECT_TRUE(Validate::RequireImageValid(PImage(3, 3), "Test"));
    EXPECT_EQ(WidthOrNothing(PImage(3, 3)).value_or(-1), 3);
}

TEST(ValidateTest, NonEmptyThrowsOnEmpty) {
    EXPECT_THROW(Validate::RequireImageNonEmpty(PImage(), "Test"), InvalidArgumentException);
    EXPECT_NO_THROW(Validate::RequireImageNonEmpty(PImage(1, 1), "Test"));
}

TEST(ValidateTest, RangeMessageNamesFunctionAndParameter) {
    try {
        CheckThreshold(2.0f);
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("CheckThreshold"), std::string::npos);
        EXPECT_NE(msg.find("threshold"), std::string::npos);
        EXPECT_NE(msg.find("[0.1, 1]"), std::string::npos);
    }
    EXPECT_NO_THROW(CheckThreshold(0.5f));
}

TEST(ValidateTest, NonNegative) {
    EXPECT_THROW(Validate::RequireNonNegative(-1, "n", "Test"), InvalidArgumentException);
    EXPECT_NO_THROW(Validate::RequireNonNegative(0, "n", "Test"));
}

TEST(ExceptionTest, HierarchyAndPrefixes) {
    try {
        throw IOException("missing.png");
    } catch (const Exception& e) {
        EXPECT_STREQ(e.what(), "I/O error: missing.png");
    }
    EXPECT_THROW(throw UnsupportedException("x"), std::runtime_error);
    EXPECT_THROW(throw OutOfRangeException("x"), Exception);
}
