#pragma once

/**
 * @file PixelMatch.h
 * @brief Perceptual pixel-level image comparison
 *
 * Compares two equally sized RGBA images, counts pixels whose perceptual
 * YIQ difference exceeds the threshold, and draws a diff visualization.
 * Differences caused by anti-aliasing can be detected and excluded.
 *
 * The plane is split into tiles (DiffOptions::maxTileWidth/Height) and
 * each tile is processed by one task of the global thread pool (inline when
 * Diff is called from a pool worker). Tasks read
 * both inputs anywhere but write only their own tile of the output, so the
 * output needs no locking; per-tile counts are summed atomically.
 *
 * Example:
 * @code
 * QImage a = QImage::FromFile("expected.png");
 * QImage b = QImage::FromFile("actual.png");
 * QImage out(a.Width(), a.Height());
 *
 * Diff::DiffOptions options;
 * options.includeAA = false;
 * uint64_t count = Diff::Diff(a, b, out, options);
 * out.SaveToFile("diff.png");
 * @endcode
 */

#include <PixMatch/Core/QImage.h>
#include <PixMatch/Core/Types.h>
#include <PixMatch/Core/Export.h>
#include <PixMatch/Diff/Compositor.h>
#include <PixMatch/Diff/DiffOptions.h>

#include <cstdint>

namespace Pix::Match::Diff {

/**
 * @brief Compare two images and draw the differences
 * @param imageA First (reference) image
 * @param imageB Second image
 * @param output Diff image, same size as the inputs; written in place
 * @param options Comparison parameters
 * @return Number of pixels classified as real differences
 *
 * Inputs may be straight or premultiplied RGBA; they are normalized to
 * straight alpha before comparing. All checks run before the output is
 * touched.
 *
 * @throws EmptyImageException if any image has no pixels
 * @throws ImageSizeMismatchException if the images differ in size
 * @throws InvalidArgumentException if options are out of range
 */
PIXMATCH_API uint64_t Diff(const QImage& imageA, const QImage& imageB, QImage& output,
                           const DiffOptions& options = DiffOptions());

/**
 * @brief Compare one rectangle of two straight-alpha images
 * @param a First image view
 * @param b Second image view
 * @param compositor Output writer
 * @param tile Rectangle to process (inside the image)
 * @param options Comparison parameters
 * @return Number of differing pixels inside tile
 *
 * Reads neighbors outside tile when needed; writes only inside it.
 * No validation is performed.
 */
PIXMATCH_API uint64_t DiffTile(const RgbaView& a, const RgbaView& b,
                               const Compositor& compositor, const Rect2i& tile,
                               const DiffOptions& options);

} // namespace Pix::Match::Diff
