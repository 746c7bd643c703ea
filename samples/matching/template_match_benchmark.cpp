/**
 * @file template_match_benchmark.cpp
 * @brief FindTemplate timing on synthetic screens
 *
 * Measures how search cost grows with source size, template size, search
 * rectangle and threshold. Set PIXVISION_MATCH_PROFILE=1 for per-call lines.
 */

#include <PixVision/Matching/TemplateMatcher.h>
#include <PixVision/Platform/Timer.h>

#include <cstdio>
#include <random>
#include <optional>
#include <string>
#include <vector>

using namespace Pix::Vision;
using namespace Pix::Vision::Matching;
using namespace Pix::Vision::Platform;

namespace {

PImage MakeScreen(int32_t width, int32_t height, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    PImage img(width, height);
    for (int32_t y = 0; y < height; ++y) {
        Rgba8* row = img.RowPtr(y);
        for (int32_t x = 0; x < width; ++x) {
            row[x] = Rgba8(static_cast<uint8_t>(dist(rng)),
                           static_cast<uint8_t>(dist(rng)),
                           static_cast<uint8_t>(dist(rng)));
        }
    }
    return img;
}

struct Case {
    std::string name;
    int32_t screenW;
    int32_t screenH;
    int32_t templW;
    int32_t templH;
    Rect2i searchRect;   // empty = whole screen
    float threshold;
};

} // anonymous namespace

int main() {
    std::printf("=== FindTemplate Benchmark ===\n");

    const std::vector<Case> cases = {
        {"640x480 / 32x32 exact",          640,  480, 32, 32, Rect2i(), 1.0f},
        {"640x480 / 32x32 t=0.8",          640,  480, 32, 32, Rect2i(), 0.8f},
        {"1920x1080 / 48x24 exact",       1920, 1080, 48, 24, Rect2i(), 1.0f},
        {"1920x1080 / 48x24 roi 400x300", 1920, 1080, 48, 24, Rect2i(1400, 700, 400, 300), 1.0f},
        {"1920x1080 / 8x8 exact",         1920, 1080,  8,  8, Rect2i(), 1.0f},
    };

    for (const Case& c : cases) {
        PImage screen = MakeScreen(c.screenW, c.screenH, 17);
        PImage templ = MakeScreen(c.templW, c.templH, 99);
        // Place near the bottom-right so most candidates are rejected first
        screen.Paste(templ, c.screenW - c.templW - 200, c.screenH - c.templH - 100);

        TemplateModel model;
        CreateTemplateModel(templ, model);

        MatchParams params;
        params.threshold = c.threshold;
        Rect2i rect = c.searchRect.Empty() ? screen.Bounds() : c.searchRect;

        std::optional<Rect2i> hit;
        BenchmarkResult result = BenchmarkDetailed([&]() {
            hit = FindTemplateModel(screen, model, rect, params);
        }, 10, 2);

        PrintBenchmarkResult(c.name, result);
        if (hit) {
            std::printf("  Hit: (%d, %d)\n", hit->x, hit->y);
        } else {
            std::printf("  Hit: none\n");
        }
    }
    return 0;
}
