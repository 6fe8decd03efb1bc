#pragma once

/**
 * @file DiffTestUtils.h
 * @brief Synthetic images shared by the Diff tests
 */

#include <PixMatch/Core/QImage.h>

#include <cstring>

namespace Pix::Match::Test {

const Rgba WHITE{255, 255, 255, 255};
const Rgba BLACK{0, 0, 0, 255};
const Rgba GRAY{128, 128, 128, 255};
const Rgba RED{255, 0, 0, 255};
const Rgba YELLOW{255, 255, 0, 255};

inline QImage SolidImage(int32_t width, int32_t height, const Rgba& color) {
    QImage img(width, height);
    img.Fill(color);
    return img;
}

/// Black above the main diagonal (x > y), white on and below it
inline QImage HardDiagonal(int32_t size) {
    QImage img(size, size);
    for (int32_t y = 0; y < size; ++y) {
        for (int32_t x = 0; x < size; ++x) {
            img.SetAt(x, y, x > y ? BLACK : WHITE);
        }
    }
    return img;
}

/// HardDiagonal with the diagonal itself rendered as an intermediate gray
inline QImage SmoothedDiagonal(int32_t size) {
    QImage img = HardDiagonal(size);
    for (int32_t i = 0; i < size; ++i) {
        img.SetAt(i, i, GRAY);
    }
    return img;
}

/// Byte-wise comparison of the visible pixels of two same-size images
inline bool SamePixels(const QImage& a, const QImage& b) {
    if (a.Size() != b.Size()) return false;
    for (int32_t y = 0; y < a.Height(); ++y) {
        if (std::memcmp(a.RowPtr(y), b.RowPtr(y),
                        static_cast<size_t>(a.Width()) * RGBA_CHANNELS) != 0) {
            return false;
        }
    }
    return true;
}

} // namespace Pix::Match::Test
