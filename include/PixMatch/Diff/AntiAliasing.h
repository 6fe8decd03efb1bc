#pragma once

/**
 * @file AntiAliasing.h
 * @brief Anti-aliased pixel detection
 *
 * Based on V. Vysniauskas, "Anti-aliased Pixel and Intensity Slope
 * Detector" (2009). A pixel is considered anti-aliased when it sits on a
 * brightness slope between a darker and a brighter neighbor, and at least
 * one of those extremes lies in a flat region of both images.
 *
 * All neighborhood scans use the 3x3 window clamped to the image. Pixels
 * whose window is clipped (image border) start with one virtual equal
 * neighbor.
 */

#include <PixMatch/Core/QImage.h>
#include <PixMatch/Core/Types.h>
#include <PixMatch/Core/Export.h>

#include <cstdint>

namespace Pix::Match::Diff {

/**
 * @brief Clamped 3x3 neighborhood of a pixel (inclusive bounds)
 */
struct PIXMATCH_API Neighborhood {
    int32_t x0 = 0;
    int32_t y0 = 0;
    int32_t x1 = 0;
    int32_t y1 = 0;
    bool onEdge = false;    ///< Any bound was clamped to the center coordinate

    /// Virtual equal-neighbor count a scan starts from
    int32_t Seed() const { return onEdge ? 1 : 0; }
};

/**
 * @brief Compute the clamped neighborhood of (x, y)
 */
PIXMATCH_API Neighborhood ClampedNeighborhood(int32_t x, int32_t y,
                                              int32_t width, int32_t height);

/**
 * @brief Check if a pixel has 3+ neighbors of exactly the same color
 *
 * Stops scanning as soon as the third equal neighbor is found.
 */
PIXMATCH_API bool HasManySiblings(const RgbaView& image, int32_t x, int32_t y);

/**
 * @brief Check if a pixel of image is likely part of anti-aliasing
 * @param image Image whose neighborhood is analyzed
 * @param x Pixel column
 * @param y Pixel row
 * @param other The other image of the comparison (same size)
 *
 * Returns false as soon as more than two neighbors have the center's
 * brightness, or when the neighborhood lacks either a darker or a
 * brighter pixel.
 */
PIXMATCH_API bool IsAntialiased(const RgbaView& image, int32_t x, int32_t y,
                                const RgbaView& other);

} // namespace Pix::Match::Diff
