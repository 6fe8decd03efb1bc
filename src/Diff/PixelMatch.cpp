/**
 * @file PixelMatch.cpp
 * @brief Tiled parallel image comparison
 */

#include <PixMatch/Diff/PixelMatch.h>
#include <PixMatch/Diff/AntiAliasing.h>
#include <PixMatch/Diff/Tiling.h>
#include <PixMatch/Color/Yiq.h>
#include <PixMatch/Core/Exception.h>
#include <PixMatch/Core/Validate.h>
#include <PixMatch/Platform/Log.h>
#include <PixMatch/Platform/Thread.h>
#include <PixMatch/Platform/Timer.h>

#include <atomic>
#include <cmath>
#include <vector>

namespace Pix::Match::Diff {

namespace {

void CheckInputs(const QImage& imageA, const QImage& imageB, const QImage& output,
                 const DiffOptions& options) {
    Validate::RequireImagesNonEmpty({&imageA, &imageB, &output}, "Diff");
    Validate::RequireSameSize({&imageA, &imageB, &output}, "Diff");
    ValidateOptions(options);

    if (output.Data() == imageA.Data() || output.Data() == imageB.Data()) {
        throw InvalidArgumentException("Diff: output must not share pixels with an input");
    }
}

} // anonymous namespace

// =============================================================================
// Tile Kernel
// =============================================================================

uint64_t DiffTile(const RgbaView& a, const RgbaView& b,
                  const Compositor& compositor, const Rect2i& tile,
                  const DiffOptions& options) {
    const double maxDelta = Color::MaxDeltaForThreshold(options.threshold);
    uint64_t count = 0;

    for (int32_t y = tile.y; y < tile.Bottom(); ++y) {
        for (int32_t x = tile.x; x < tile.Right(); ++x) {
            const Rgba pa = a.At(x, y);
            const Rgba pb = b.At(x, y);

            double delta = Color::ColorDelta(pa, pb);

            if (std::abs(delta) <= maxDelta) {
                compositor.PaintBackground(x, y, pa);
                continue;
            }

            // Above threshold: real change or anti-aliasing in either image
            if (!options.includeAA &&
                (IsAntialiased(a, x, y, b) || IsAntialiased(b, x, y, a))) {
                compositor.PaintAntialiased(x, y);
            } else {
                compositor.PaintDiff(x, y);
                ++count;
            }
        }
    }

    return count;
}

// =============================================================================
// Diff
// =============================================================================

uint64_t Diff(const QImage& imageA, const QImage& imageB, QImage& output,
              const DiffOptions& options) {
    auto log = Platform::Logger();

    try {
        CheckInputs(imageA, imageB, output, options);
    } catch (const Exception& e) {
        log->warn("{}", e.what());
        throw;
    }

    Platform::Timer timer(true);

    const QImage a = imageA.ToStraightAlpha();
    const QImage b = imageB.ToStraightAlpha();
    const RgbaView viewA(a);
    const RgbaView viewB(b);
    const Compositor compositor(output, options);

    const std::vector<Rect2i> tiles = ComputeTiles(
        output.Width(), output.Height(), options.maxTileWidth, options.maxTileHeight);

    log->debug("Diff {}: {} tile(s), max extent {}x{}",
               output.Size().ToString(), tiles.size(),
               options.maxTileWidth, options.maxTileHeight);

    std::atomic<uint64_t> total{0};
    Platform::RunTasks(tiles.size(), [&](size_t i) {
        uint64_t local = DiffTile(viewA, viewB, compositor, tiles[i], options);
        total.fetch_add(local, std::memory_order_relaxed);
    });

    const uint64_t count = total.load();
    log->debug("Diff {}: {} differing pixel(s) in {:.3f} ms",
               output.Size().ToString(), count, timer.ElapsedMs());
    return count;
}

} // namespace Pix::Match::Diff
