/**
 * @file Tiling.cpp
 * @brief Tile partition implementation
 */

#include <PixMatch/Diff/Tiling.h>

#include <algorithm>

namespace Pix::Match::Diff {

std::vector<Rect2i> ComputeTiles(int32_t width, int32_t height,
                                 int32_t maxTileWidth, int32_t maxTileHeight) {
    std::vector<Rect2i> tiles;
    if (width <= 0 || height <= 0) {
        return tiles;
    }

    const int32_t tileW = std::clamp<int32_t>(maxTileWidth, 1, width);
    const int32_t tileH = std::clamp<int32_t>(maxTileHeight, 1, height);

    const int32_t cols = (width + tileW - 1) / tileW;
    const int32_t rows = (height + tileH - 1) / tileH;
    tiles.reserve(static_cast<size_t>(cols) * rows);

    for (int32_t y0 = 0; y0 < height; y0 += tileH) {
        const int32_t h = std::min(tileH, height - y0);
        for (int32_t x0 = 0; x0 < width; x0 += tileW) {
            tiles.emplace_back(x0, y0, std::min(tileW, width - x0), h);
        }
    }

    return tiles;
}

} // namespace Pix::Match::Diff
