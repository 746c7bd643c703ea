#pragma once

#include <PixVision/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for PixVision
 *
 * Matching never throws for bad geometry or a missing match; these are
 * raised by image construction, pixel access and file I/O.
 */

#include <stdexcept>
#include <string>

namespace Pix::Vision {

/**
 * @brief Base exception class for PixVision
 */
class PIXVISION_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class PIXVISION_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception (pixel access outside the image)
 */
class PIXVISION_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief File I/O exception
 */
class PIXVISION_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Unsupported operation, file format or channel layout
 */
class PIXVISION_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

} // namespace Pix::Vision
