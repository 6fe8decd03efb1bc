#pragma once

/**
 * @file Compositor.h
 * @brief Writes classified pixels into the diff output image
 */

#include <PixMatch/Core/QImage.h>
#include <PixMatch/Core/Types.h>
#include <PixMatch/Core/Export.h>
#include <PixMatch/Diff/DiffOptions.h>

#include <cstdint>

namespace Pix::Match::Diff {

/**
 * @brief Gray background pixel for an unchanged source pixel
 * @param source Pixel of the first image (straight alpha)
 * @param alpha Background opacity [0, 1]
 * @return Opaque gray: 255 + (Y - 255) * alpha * source.a / 255, rounded
 */
PIXMATCH_API Rgba GrayPixel(const Rgba& source, double alpha);

/**
 * @brief Output writer for one comparison
 *
 * Holds raw row access to the output image. Concurrent use from several
 * tasks is safe as long as each task writes a disjoint set of pixels.
 * Marker colors are premultiplied once when the output is premultiplied.
 */
class PIXMATCH_API Compositor {
public:
    Compositor(QImage& output, const DiffOptions& options);

    /// Anti-aliased pixel: aaColor, or untouched when masking
    void PaintAntialiased(int32_t x, int32_t y) const;

    /// Real difference: diffColor
    void PaintDiff(int32_t x, int32_t y) const;

    /// Unchanged pixel: faded gray of source, or untouched when masking
    void PaintBackground(int32_t x, int32_t y, const Rgba& source) const;

private:
    void Put(int32_t x, int32_t y, const Rgba& value) const;

    uint8_t* data_;
    size_t stride_;
    double alpha_;
    bool diffMask_;
    Rgba aaColor_;
    Rgba diffColor_;
};

} // namespace Pix::Match::Diff
