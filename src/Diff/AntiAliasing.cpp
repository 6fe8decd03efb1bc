/**
 * @file AntiAliasing.cpp
 * @brief Anti-aliased pixel detection implementation
 */

#include <PixMatch/Diff/AntiAliasing.h>
#include <PixMatch/Color/Yiq.h>

#include <algorithm>

namespace Pix::Match::Diff {

Neighborhood ClampedNeighborhood(int32_t x, int32_t y, int32_t width, int32_t height) {
    Neighborhood n;
    n.x0 = std::max(x - 1, 0);
    n.y0 = std::max(y - 1, 0);
    n.x1 = std::min(x + 1, width - 1);
    n.y1 = std::min(y + 1, height - 1);
    n.onEdge = x == n.x0 || x == n.x1 || y == n.y0 || y == n.y1;
    return n;
}

bool HasManySiblings(const RgbaView& image, int32_t x, int32_t y) {
    Neighborhood n = ClampedNeighborhood(x, y, image.Width(), image.Height());
    int32_t zeroes = n.Seed();
    const Rgba center = image.At(x, y);

    for (int32_t nx = n.x0; nx <= n.x1; ++nx) {
        for (int32_t ny = n.y0; ny <= n.y1; ++ny) {
            if (nx == x && ny == y) continue;

            if (image.At(nx, ny) == center) {
                ++zeroes;
            }
            if (zeroes > 2) {
                return true;
            }
        }
    }

    return false;
}

bool IsAntialiased(const RgbaView& image, int32_t x, int32_t y, const RgbaView& other) {
    Neighborhood n = ClampedNeighborhood(x, y, image.Width(), image.Height());
    int32_t zeroes = n.Seed();
    const Rgba center = image.At(x, y);

    double minDelta = 0.0;
    double maxDelta = 0.0;
    Point2i minPos;   // neighbor with the most negative luma delta
    Point2i maxPos;   // neighbor with the most positive luma delta

    for (int32_t nx = n.x0; nx <= n.x1; ++nx) {
        for (int32_t ny = n.y0; ny <= n.y1; ++ny) {
            if (nx == x && ny == y) continue;

            double delta = Color::ColorDelta(center, image.At(nx, ny), true);

            if (delta == 0.0) {
                // More than 2 equal-brightness neighbors: flat area, not AA
                if (++zeroes > 2) {
                    return false;
                }
            } else if (delta < minDelta) {
                minDelta = delta;
                minPos = {nx, ny};
            } else if (delta > maxDelta) {
                maxDelta = delta;
                maxPos = {nx, ny};
            }
        }
    }

    // Needs neighbors on both sides of the center brightness
    if (minDelta == 0.0 || maxDelta == 0.0) {
        return false;
    }

    return (HasManySiblings(image, minPos.x, minPos.y) &&
            HasManySiblings(other, minPos.x, minPos.y)) ||
           (HasManySiblings(image, maxPos.x, maxPos.y) &&
            HasManySiblings(other, maxPos.x, maxPos.y));
}

} // namespace Pix::Match::Diff
