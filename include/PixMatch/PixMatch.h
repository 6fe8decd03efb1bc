#pragma once

/**
 * @file PixMatch.h
 * @brief Main header file for PixMatch library
 *
 * PixMatch is a perceptual pixel-level image comparison library for
 * visual regression testing, with anti-aliasing detection.
 *
 * @author PixMatch Team
 */

// Configuration and export macros
#include <PixMatch/PixMatchConfig.h>
#include <PixMatch/Core/Export.h>

// Core types and utilities
#include <PixMatch/Core/Types.h>
#include <PixMatch/Core/Constants.h>
#include <PixMatch/Core/Exception.h>
#include <PixMatch/Core/QImage.h>

// Platform abstraction
#include <PixMatch/Platform/Log.h>
#include <PixMatch/Platform/Thread.h>
#include <PixMatch/Platform/Timer.h>

// Comparison
#include <PixMatch/Color/Yiq.h>
#include <PixMatch/Diff/DiffOptions.h>
#include <PixMatch/Diff/PixelMatch.h>

namespace Pix::Match {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return PIXMATCH_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = PIXMATCH_VERSION_MAJOR;
    minor = PIXMATCH_VERSION_MINOR;
    patch = PIXMATCH_VERSION_PATCH;
}

} // namespace Pix::Match
