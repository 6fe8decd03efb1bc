#pragma once

/**
 * @file Constants.h
 * @brief Library-wide constants
 */

#include <cstddef>
#include <cstdint>

namespace Pix::Match {

/// Row alignment for image buffers (bytes)
constexpr size_t MEMORY_ALIGNMENT = 64;

/// Bytes per RGBA pixel
constexpr int32_t RGBA_CHANNELS = 4;

/// Maximum value of the YIQ difference metric (for pure black vs. pure white)
constexpr double MAX_YIQ_DELTA = 35215.0;

/// Default maximum tile extent (pixels) used when splitting the image plane
constexpr int32_t DEFAULT_TILE_EXTENT = 2000;

} // namespace Pix::Match
