#pragma once

/**
 * @file PixVision.h
 * @brief Main header file for PixVision library
 *
 * PixVision locates a template image inside a larger image (typically a
 * screenshot) by exhaustive per-pixel colour comparison, with adjustable
 * tolerance and transparent template pixels acting as wildcards.
 *
 * @author PixVision Team
 * @version 0.1.0
 */

// Configuration and export macros
#include <PixVision/PixVisionConfig.h>
#include <PixVision/Core/Export.h>

// Core types and utilities
#include <PixVision/Core/Types.h>
#include <PixVision/Core/Exception.h>
#include <PixVision/Core/PImage.h>
#include <PixVision/Core/Validate.h>

// Platform abstraction
#include <PixVision/Platform/Timer.h>

// Feature modules
#include <PixVision/IO/ImageIO.h>
#include <PixVision/Matching/MaskedPixel.h>
#include <PixVision/Matching/TemplateMatcher.h>

namespace Pix::Vision {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return PIXVISION_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = PIXVISION_VERSION_MAJOR;
    minor = PIXVISION_VERSION_MINOR;
    patch = PIXVISION_VERSION_PATCH;
}

} // namespace Pix::Vision
