#pragma once

/**
 * @file Tiling.h
 * @brief Partition of the image plane into disjoint tiles
 */

#include <PixMatch/Core/Types.h>
#include <PixMatch/Core/Export.h>

#include <cstdint>
#include <vector>

namespace Pix::Match::Diff {

/**
 * @brief Split a width x height plane into row-major tiles
 * @param width Plane width (> 0)
 * @param height Plane height (> 0)
 * @param maxTileWidth Maximum tile width, clamped to [1, width]
 * @param maxTileHeight Maximum tile height, clamped to [1, height]
 * @return Tiles covering every pixel exactly once; the last column/row of
 *         tiles is clipped to the plane. Empty for an empty plane.
 *
 * A plane no larger than the tile extent yields a single tile equal to
 * the whole plane.
 */
PIXMATCH_API std::vector<Rect2i> ComputeTiles(int32_t width, int32_t height,
                                              int32_t maxTileWidth, int32_t maxTileHeight);

} // namespace Pix::Match::Diff
