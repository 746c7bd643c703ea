#pragma once

/**
 * @file Validate.h
 * @brief Argument checks shared by PixVision operations
 *
 * An empty image is not an error for a search (it simply finds nothing), but
 * is one for operations that must produce output. Messages read
 * "<function>: <problem>".
 */

#include <PixVision/Core/Exception.h>
#include <PixVision/Core/PImage.h>

#include <cstdio>
#include <string>

namespace Pix::Vision::Validate {

namespace Detail {

inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

} // namespace Detail

/**
 * @brief Check an input image of a search
 * @return false if empty (caller returns its "nothing found" value)
 * @throws InvalidArgumentException if the image is non-empty but unusable
 */
inline bool RequireImageValid(const PImage& image, const char* funcName) {
    if (image.Empty()) {
        return false;
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
    return true;
}

/// @throws InvalidArgumentException if the image is empty or unusable
inline void RequireImageNonEmpty(const PImage& image, const char* funcName) {
    if (!RequireImageValid(image, funcName)) {
        throw InvalidArgumentException(std::string(funcName) + ": image is empty");
    }
}

/// @throws InvalidArgumentException unless minVal <= value <= maxVal
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (value < minVal || value > maxVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/// @throws InvalidArgumentException if value < 0
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Macros (record the calling function via __func__)
// =============================================================================

/// Empty image: return retval, e.g. std::nullopt from a search
#define PIXVISION_REQUIRE_IMAGE_OR(img, retval) \
    if (!::Pix::Vision::Validate::RequireImageValid(img, __func__)) return retval

/// Empty image: return from a void function
#define PIXVISION_REQUIRE_IMAGE_VOID(img) \
    if (!::Pix::Vision::Validate::RequireImageValid(img, __func__)) return

#define PIXVISION_REQUIRE_RANGE(val, min, max) \
    ::Pix::Vision::Validate::RequireRange(val, min, max, #val, __func__)

} // namespace Pix::Vision::Validate
