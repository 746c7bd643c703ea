#include <PixVision/Matching/TemplateMatcher.h>
#include <PixVision/IO/ImageIO.h>
#include <PixVision/Platform/Timer.h>
#include <PixVision/Core/Exception.h>

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

using namespace Pix::Vision;
using namespace Pix::Vision::Matching;
using namespace Pix::Vision::IO;

namespace {

void PrintUsage(const char* exe) {
    std::printf("Usage: %s <source> <template> [threshold] [x y w h] [--full]\n", exe);
    std::printf("  threshold  per-channel similarity, 0.1 .. 1.0 (default 1.0)\n");
    std::printf("  x y w h    search rectangle (default whole source)\n");
    std::printf("  --full     also scan the last fitting columns/rows\n");
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage(argv[0]);
        return 1;
    }

    MatchParams params;
    int positional = argc;
    if (std::string(argv[argc - 1]) == "--full") {
        params.includeLastPosition = true;
        --positional;
    }
    if (positional != 3 && positional != 4 && positional != 8) {
        PrintUsage(argv[0]);
        return 1;
    }
    if (positional >= 4) {
        params.threshold = std::strtof(argv[3], nullptr);
    }

    try {
        PImage source;
        PImage templ;
        ReadImage(argv[1], source);
        ReadImage(argv[2], templ);
        std::printf("Source:   %dx%d\n", source.Width(), source.Height());
        std::printf("Template: %dx%d\n", templ.Width(), templ.Height());

        Rect2i searchRect = source.Bounds();
        if (positional == 8) {
            searchRect = Rect2i(std::atoi(argv[4]), std::atoi(argv[5]),
                                std::atoi(argv[6]), std::atoi(argv[7]));
        }

        std::optional<Rect2i> hit;
        {
            Platform::ScopedTimer timer("FindTemplate");
            hit = FindTemplate(source, templ, searchRect, params);
        }

        if (!hit) {
            std::printf("No match (threshold=%.3f)\n", ClampThreshold(params.threshold));
            return 2;
        }

        std::printf("Match: x=%d y=%d w=%d h=%d\n", hit->x, hit->y, hit->width, hit->height);

        PImage matched;
        CropImage(source, *hit, matched);
        if (WriteImage(matched, "find_template_hit.png")) {
            std::printf("Saved: find_template_hit.png\n");
        } else {
            std::printf("Failed to save find_template_hit.png\n");
        }
    } catch (const Exception& e) {
        std::printf("Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
