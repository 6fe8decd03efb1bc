#include <gtest/gtest.h>
#include <PixMatch/Core/QImage.h>
#include <PixMatch/Core/Exception.h>
#include <PixMatch/Platform/Memory.h>

#include <cstdio>
#include <string>
#include <vector>

using namespace Pix::Match;

// =============================================================================
// Construction
// =============================================================================

TEST(QImageTest, DefaultIsEmpty) {
    QImage img;
    EXPECT_TRUE(img.Empty());
    EXPECT_FALSE(img.IsValid());
    EXPECT_EQ(img.Size(), Size2i(0, 0));
}

TEST(QImageTest, ConstructZeroFilledAndAligned) {
    QImage img(5, 3);
    EXPECT_EQ(img.Width(), 5);
    EXPECT_EQ(img.Height(), 3);
    EXPECT_EQ(img.Format(), PixelFormat::RGBA);
    EXPECT_GE(img.Stride(), 20u);
    EXPECT_EQ(img.Stride() % MEMORY_ALIGNMENT, 0u);
    EXPECT_TRUE(Platform::IsAligned(img.Data()));

    for (int32_t y = 0; y < 3; ++y) {
        for (int32_t x = 0; x < 5; ++x) {
            EXPECT_EQ(img.At(x, y), Rgba{});
        }
    }
}

TEST(QImageTest, NonPositiveDimensionsThrow) {
    EXPECT_THROW(QImage(0, 4), InvalidArgumentException);
    EXPECT_THROW(QImage(4, -1), InvalidArgumentException);
}

TEST(QImageTest, SetAtAndOutOfRange) {
    QImage img(2, 2);
    img.SetAt(1, 0, Rgba{10, 20, 30, 40});
    EXPECT_EQ(img.At(1, 0), (Rgba{10, 20, 30, 40}));
    EXPECT_THROW(img.At(2, 0), InvalidArgumentException);
    EXPECT_THROW(img.SetAt(0, -1, Rgba{}), InvalidArgumentException);
}

TEST(QImageTest, CopyIsShallowCloneIsDeep) {
    QImage img(3, 3);
    img.Fill(Rgba{1, 2, 3, 255});

    QImage shallow = img;
    QImage deep = img.Clone();
    EXPECT_EQ(shallow.Data(), img.Data());
    EXPECT_NE(deep.Data(), img.Data());

    img.SetAt(0, 0, Rgba{9, 9, 9, 9});
    EXPECT_EQ(shallow.At(0, 0), (Rgba{9, 9, 9, 9}));
    EXPECT_EQ(deep.At(0, 0), (Rgba{1, 2, 3, 255}));
}

TEST(QImageTest, FromDataRespectsStride) {
    std::vector<uint8_t> data = {
        1, 2, 3, 4,    5, 6, 7, 8,    9, 10, 11, 12,
        13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23, 24
    };
    QImage img = QImage::FromData(data.data(), 3, 2);
    EXPECT_EQ(img.At(2, 0), (Rgba{9, 10, 11, 12}));
    EXPECT_EQ(img.At(0, 1), (Rgba{13, 14, 15, 16}));
}

// =============================================================================
// Pixel format boundary
// =============================================================================

TEST(QImageTest, StraightAlphaIsShared) {
    QImage img(2, 2);
    QImage straight = img.ToStraightAlpha();
    EXPECT_EQ(straight.Data(), img.Data());
}

TEST(QImageTest, PremultipliedIsUnpremultiplied) {
    QImage img(2, 1, PixelFormat::PremultipliedRGBA);
    img.SetAt(0, 0, Rgba{64, 32, 0, 128});
    img.SetAt(1, 0, Rgba{50, 50, 50, 0});

    QImage straight = img.ToStraightAlpha();
    EXPECT_EQ(straight.Format(), PixelFormat::RGBA);
    EXPECT_NE(straight.Data(), img.Data());
    EXPECT_EQ(straight.At(0, 0), (Rgba{128, 64, 0, 128}));
    EXPECT_EQ(straight.At(1, 0), (Rgba{0, 0, 0, 0}));
}

// =============================================================================
// Views
// =============================================================================

TEST(RgbaViewTest, MatchesImageAccess) {
    QImage img(4, 3);
    img.SetAt(3, 2, Rgba{7, 8, 9, 10});
    RgbaView view(img);
    EXPECT_EQ(view.Width(), 4);
    EXPECT_EQ(view.Height(), 3);
    EXPECT_EQ(view.At(3, 2), img.At(3, 2));
}

// =============================================================================
// File I/O
// =============================================================================

TEST(QImageTest, SaveAndLoadPng) {
    QImage img(3, 2);
    img.Fill(Rgba{200, 100, 50, 255});
    img.SetAt(1, 1, Rgba{0, 0, 0, 128});

    std::string path = ::testing::TempDir() + "pixmatch_roundtrip.png";
    ASSERT_TRUE(img.SaveToFile(path));

    QImage loaded = QImage::FromFile(path);
    EXPECT_EQ(loaded.Size(), img.Size());
    EXPECT_EQ(loaded.At(0, 0), (Rgba{200, 100, 50, 255}));
    EXPECT_EQ(loaded.At(1, 1), (Rgba{0, 0, 0, 128}));
    std::remove(path.c_str());
}

TEST(QImageTest, LoadMissingFileThrows) {
    EXPECT_THROW(QImage::FromFile("/nonexistent/pixmatch.png"), IOException);
}

TEST(QImageTest, SaveEmptyFails) {
    QImage img;
    EXPECT_FALSE(img.SaveToFile(::testing::TempDir() + "pixmatch_empty.png"));
}
