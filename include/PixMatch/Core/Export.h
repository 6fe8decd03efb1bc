#pragma once

/**
 * @file Export.h
 * @brief PIXMATCH_API symbol visibility
 *
 * Static builds (the default) leave PIXMATCH_API empty. With
 * BUILD_SHARED_LIBS, CMake defines PIXMATCH_BUILD_SHARED while compiling
 * the pixmatch target and PIXMATCH_USE_SHARED for its consumers.
 */

#if defined(_WIN32)
    #define PIXMATCH_SYMBOL_EXPORT __declspec(dllexport)
    #define PIXMATCH_SYMBOL_IMPORT __declspec(dllimport)
#else
    #define PIXMATCH_SYMBOL_EXPORT __attribute__((visibility("default")))
    #define PIXMATCH_SYMBOL_IMPORT
#endif

#if defined(PIXMATCH_BUILD_SHARED)
    #define PIXMATCH_API PIXMATCH_SYMBOL_EXPORT
#elif defined(PIXMATCH_USE_SHARED)
    #define PIXMATCH_API PIXMATCH_SYMBOL_IMPORT
#else
    #define PIXMATCH_API
#endif
