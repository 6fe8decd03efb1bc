#pragma once

/**
 * @file DiffOptions.h
 * @brief Configuration for image comparison
 */

#include <PixMatch/Core/Types.h>
#include <PixMatch/Core/Constants.h>
#include <PixMatch/Core/Export.h>

#include <optional>

namespace Pix::Match::Diff {

/**
 * @brief Comparison parameters
 *
 * A plain value: construct, adjust fields, pass to Diff(). The comparison
 * only reads it.
 *
 * @code
 * DiffOptions options;
 * options.threshold = 0.05;
 * options.includeAA = false;   // suppress anti-aliasing differences
 * options.diffMask = false;    // draw the faded source behind markers
 * @endcode
 */
struct PIXMATCH_API DiffOptions {
    /// Matching threshold [0, 1]; smaller is more sensitive
    double threshold = 0.1;

    /// Count anti-aliased pixels as differences (skips AA detection)
    bool includeAA = true;

    /// Opacity [0, 1] of the first image in the output background
    double alpha = 0.1;

    /// Color of anti-aliased pixels in the output
    Rgba aaColor{255, 255, 0, 255};

    /// Color of differing pixels in the output
    Rgba diffColor{255, 0, 0, 255};

    /// Alternative color for dark-on-light differences (reserved, not drawn)
    std::optional<Rgba> diffColorAlt;

    /// Draw only markers; leave unclassified output pixels untouched
    bool diffMask = true;

    /// Maximum tile width in pixels (one task per tile)
    int32_t maxTileWidth = DEFAULT_TILE_EXTENT;

    /// Maximum tile height in pixels
    int32_t maxTileHeight = DEFAULT_TILE_EXTENT;
};

/**
 * @brief Check option ranges
 * @throws InvalidArgumentException if threshold/alpha are outside [0, 1]
 *         or a tile extent is not positive
 */
PIXMATCH_API void ValidateOptions(const DiffOptions& options);

} // namespace Pix::Match::Diff
