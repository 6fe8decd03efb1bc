/**
 * @file diff_images.cpp
 * @brief Compare two image files and write a diff visualization
 *
 * Usage: diff_images <image1> <image2> <output.png> [threshold] [--aa] [--no-mask] [--verbose]
 *
 *   threshold   matching threshold in [0, 1] (default 0.1)
 *   --aa        detect anti-aliasing and exclude it from the count
 *   --no-mask   draw the faded first image behind the markers
 *   --verbose   also print per-run debug logging (tiles, timing)
 *
 * Timings of the load step are reported through the pixmatch logger, which
 * this program sets to info level.
 *
 * Exit code: 0 = identical, 1 = different, 2 = error
 */

#include <PixMatch/PixMatch.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace Pix::Match;
using namespace Pix::Match::Platform;

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <image1> <image2> <output.png> [threshold] [--aa] [--no-mask] [--verbose]"
              << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string pathA = argv[1];
    const std::string pathB = argv[2];
    const std::string outputPath = argv[3];

    SetLogLevel(spdlog::level::info);

    Diff::DiffOptions options;
    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--aa") == 0) {
            options.includeAA = false;
        } else if (std::strcmp(argv[i], "--no-mask") == 0) {
            options.diffMask = false;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            SetLogLevel(spdlog::level::debug);
        } else {
            char* end = nullptr;
            double value = std::strtod(argv[i], &end);
            if (end == argv[i] || *end != '\0') {
                std::cerr << "Unknown argument: " << argv[i] << std::endl;
                PrintUsage(argv[0]);
                return 2;
            }
            options.threshold = value;
        }
    }

    std::cout << "=== PixMatch " << GetVersion() << " ===" << std::endl;

    try {
        QImage imageA;
        QImage imageB;
        {
            ScopedTimer loadTimer("Load images");
            imageA = QImage::FromFile(pathA);
            imageB = QImage::FromFile(pathB);
        }
        std::cout << "Image size: " << imageA.Size().ToString() << std::endl;

        QImage output(imageA.Width(), imageA.Height());

        Timer timer(true);
        uint64_t count = Diff::Diff(imageA, imageB, output, options);
        timer.Stop();

        std::cout << "Different pixels: " << count << std::endl;
        std::cout << "Compared in " << timer.ElapsedMs() << " ms" << std::endl;

        if (!output.SaveToFile(outputPath)) {
            std::cerr << "Failed to save " << outputPath << std::endl;
            return 2;
        }
        std::cout << "Diff written to " << outputPath << std::endl;

        return count == 0 ? 0 : 1;
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
