#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - PIXVISION_BUILD_SHARED: when building PixVision as shared library
 *   - PIXVISION_USE_SHARED: when using PixVision as shared library
 *   - PIXVISION_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PIXVISION_BUILD_SHARED)
        #define PIXVISION_API __declspec(dllexport)
    #elif defined(PIXVISION_USE_SHARED)
        #define PIXVISION_API __declspec(dllimport)
    #else
        #define PIXVISION_API
    #endif
    #define PIXVISION_CALL __cdecl
#else
    #if defined(PIXVISION_BUILD_SHARED)
        #define PIXVISION_API __attribute__((visibility("default")))
    #else
        #define PIXVISION_API
    #endif
    #define PIXVISION_CALL
#endif
