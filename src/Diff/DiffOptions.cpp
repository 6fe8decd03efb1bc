#include <PixMatch/Diff/DiffOptions.h>
#include <PixMatch/Core/Validate.h>

namespace Pix::Match::Diff {

void ValidateOptions(const DiffOptions& options) {
    Validate::RequireRange(options.threshold, 0.0, 1.0, "threshold", "Diff");
    Validate::RequireRange(options.alpha, 0.0, 1.0, "alpha", "Diff");
    Validate::RequirePositive(options.maxTileWidth, "maxTileWidth", "Diff");
    Validate::RequirePositive(options.maxTileHeight, "maxTileHeight", "Diff");
}

} // namespace Pix::Match::Diff
