#pragma once

/**
 * @file Yiq.h
 * @brief NTSC YIQ conversion and perceptual color difference
 *
 * Color difference follows Kotsarenko & Ramos, "Measuring perceived color
 * difference using YIQ NTSC transmission color space in mobile
 * applications" (2010).
 *
 * Semi-transparent pixels are composited over white before conversion:
 *   c' = 255 + (c - 255) * a / 255
 */

#include <PixMatch/Core/Types.h>
#include <PixMatch/Core/Constants.h>
#include <PixMatch/Core/Export.h>

#include <cstdint>

namespace Pix::Match::Color {

/**
 * @brief Luma and chroma components of a pixel
 */
struct PIXMATCH_API Yiq {
    double y = 0.0;     ///< Luma (perceived brightness)
    double i = 0.0;     ///< In-phase chroma (orange-blue)
    double q = 0.0;     ///< Quadrature chroma (purple-green)
};

// =============================================================================
// Channel Conversion
// =============================================================================

PIXMATCH_API double RgbToY(double r, double g, double b);
PIXMATCH_API double RgbToI(double r, double g, double b);
PIXMATCH_API double RgbToQ(double r, double g, double b);

/**
 * @brief Blend a channel toward white
 * @param c Channel value [0, 255]
 * @param a Opacity [0, 1]
 */
PIXMATCH_API double BlendWithWhite(double c, double a);

/**
 * @brief Convert pixel to YIQ, compositing over white when not opaque
 */
PIXMATCH_API Yiq PixelToYiq(const Rgba& pixel);

// =============================================================================
// Color Difference
// =============================================================================

/**
 * @brief Signed perceptual difference between two pixels
 * @param p1 First pixel
 * @param p2 Second pixel
 * @param yOnly Return luma difference only (Y1 - Y2)
 * @return 0 for identical pixels. Full mode returns the weighted squared
 *         YIQ distance in [0, MAX_YIQ_DELTA], negative when p1 is brighter
 *         than p2 (p2 got darker).
 */
PIXMATCH_API double ColorDelta(const Rgba& p1, const Rgba& p2, bool yOnly = false);

/**
 * @brief Absolute delta limit for a relative threshold
 * @param threshold Sensitivity in [0, 1]; smaller is more sensitive
 * @return MAX_YIQ_DELTA * threshold^2
 */
inline double MaxDeltaForThreshold(double threshold) {
    return MAX_YIQ_DELTA * threshold * threshold;
}

} // namespace Pix::Match::Color
