#pragma once

/**
 * @file MaskedPixel.h
 * @brief Template pixel that is either an opaque colour or a wildcard
 *
 * Template authors mask regions (dynamic text, counters) by making them
 * transparent. Only alpha 255 counts as opaque; every other alpha value
 * collapses to a wildcard that matches any source colour.
 */

#include <PixVision/Core/Export.h>
#include <PixVision/Core/Types.h>

#include <cstdint>

namespace Pix::Vision::Matching {

class PIXVISION_API MaskedPixel {
public:
    /// Wildcard by default
    MaskedPixel() = default;

    /// Pixel that must match the given colour
    static MaskedPixel Opaque(uint8_t r, uint8_t g, uint8_t b) {
        return MaskedPixel(r, g, b, false);
    }

    /// Pixel that matches anything
    static MaskedPixel Wildcard() {
        return MaskedPixel();
    }

    /// Collapse alpha to binary: 255 = opaque, anything else = wildcard
    static MaskedPixel FromRgba(const Rgba8& px) {
        return px.a == ALPHA_OPAQUE ? Opaque(px.r, px.g, px.b) : Wildcard();
    }

    bool IsWildcard() const { return wildcard_; }
    bool IsOpaque() const { return !wildcard_; }

    /// Colour channels; zero for wildcards
    uint8_t R() const { return r_; }
    uint8_t G() const { return g_; }
    uint8_t B() const { return b_; }

    /// Back to RGBA (wildcards become transparent black)
    Rgba8 ToRgba() const {
        return wildcard_ ? Rgba8(0, 0, 0, ALPHA_TRANSPARENT)
                         : Rgba8(r_, g_, b_, ALPHA_OPAQUE);
    }

    bool operator==(const MaskedPixel& other) const {
        if (wildcard_ || other.wildcard_) {
            return wildcard_ == other.wildcard_;
        }
        return r_ == other.r_ && g_ == other.g_ && b_ == other.b_;
    }
    bool operator!=(const MaskedPixel& other) const { return !(*this == other); }

private:
    MaskedPixel(uint8_t r, uint8_t g, uint8_t b, bool wildcard)
        : r_(r), g_(g), b_(b), wildcard_(wildcard) {}

    uint8_t r_ = 0;
    uint8_t g_ = 0;
    uint8_t b_ = 0;
    bool wildcard_ = true;
};

} // namespace Pix::Vision::Matching
