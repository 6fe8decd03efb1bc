/**
 * @file test_antialiasing.cpp
 * @brief Unit tests for Diff/AntiAliasing.h
 */

#include <gtest/gtest.h>
#include <PixMatch/Diff/AntiAliasing.h>

#include "DiffTestUtils.h"

using namespace Pix::Match;
using namespace Pix::Match::Diff;
using namespace Pix::Match::Test;

// =============================================================================
// ClampedNeighborhood
// =============================================================================

TEST(NeighborhoodTest, InteriorIsFullWindow) {
    Neighborhood n = ClampedNeighborhood(2, 2, 5, 5);
    EXPECT_EQ(n.x0, 1);
    EXPECT_EQ(n.y0, 1);
    EXPECT_EQ(n.x1, 3);
    EXPECT_EQ(n.y1, 3);
    EXPECT_FALSE(n.onEdge);
    EXPECT_EQ(n.Seed(), 0);
}

TEST(NeighborhoodTest, CornerIsClamped) {
    Neighborhood n = ClampedNeighborhood(0, 0, 5, 5);
    EXPECT_EQ(n.x0, 0);
    EXPECT_EQ(n.y0, 0);
    EXPECT_EQ(n.x1, 1);
    EXPECT_EQ(n.y1, 1);
    EXPECT_TRUE(n.onEdge);
    EXPECT_EQ(n.Seed(), 1);

    Neighborhood far = ClampedNeighborhood(4, 4, 5, 5);
    EXPECT_EQ(far.x0, 3);
    EXPECT_EQ(far.x1, 4);
    EXPECT_EQ(far.y1, 4);
    EXPECT_EQ(far.Seed(), 1);
}

TEST(NeighborhoodTest, EdgeSeedIsOneEvenWhenSeveralBoundsClamp) {
    // 1-pixel-wide column: both x bounds clamp, still a single seed
    Neighborhood n = ClampedNeighborhood(0, 2, 1, 5);
    EXPECT_EQ(n.x0, 0);
    EXPECT_EQ(n.x1, 0);
    EXPECT_EQ(n.Seed(), 1);

    Neighborhood single = ClampedNeighborhood(0, 0, 1, 1);
    EXPECT_EQ(single.x1, 0);
    EXPECT_EQ(single.y1, 0);
    EXPECT_EQ(single.Seed(), 1);
}

// =============================================================================
// HasManySiblings
// =============================================================================

TEST(HasManySiblingsTest, UniformCorner) {
    QImage img = SolidImage(3, 3, WHITE);
    EXPECT_TRUE(HasManySiblings(RgbaView(img), 0, 0));
    EXPECT_TRUE(HasManySiblings(RgbaView(img), 1, 1));
}

TEST(HasManySiblingsTest, DistinctCorner) {
    QImage img(2, 2);
    img.SetAt(0, 0, Rgba{1, 0, 0, 255});
    img.SetAt(1, 0, Rgba{2, 0, 0, 255});
    img.SetAt(0, 1, Rgba{3, 0, 0, 255});
    img.SetAt(1, 1, Rgba{4, 0, 0, 255});
    EXPECT_FALSE(HasManySiblings(RgbaView(img), 0, 0));
}

TEST(HasManySiblingsTest, CornerSeedCountsAsOneSibling) {
    QImage img = SolidImage(2, 2, WHITE);
    img.SetAt(1, 1, BLACK);
    RgbaView view(img);
    // Seed + 2 equal neighbors
    EXPECT_TRUE(HasManySiblings(view, 0, 0));
    // Seed only
    EXPECT_FALSE(HasManySiblings(view, 1, 1));
}

TEST(HasManySiblingsTest, InteriorNeedsThreeEqual) {
    QImage img = SolidImage(3, 3, BLACK);
    img.SetAt(1, 1, WHITE);
    img.SetAt(0, 0, WHITE);
    img.SetAt(1, 0, WHITE);
    EXPECT_FALSE(HasManySiblings(RgbaView(img), 1, 1));

    img.SetAt(2, 0, WHITE);
    EXPECT_TRUE(HasManySiblings(RgbaView(img), 1, 1));
}

TEST(HasManySiblingsTest, SinglePixelImage) {
    QImage img = SolidImage(1, 1, WHITE);
    EXPECT_FALSE(HasManySiblings(RgbaView(img), 0, 0));
}

TEST(HasManySiblingsTest, ExactEqualityIncludesAlpha) {
    QImage img = SolidImage(3, 3, Rgba{10, 10, 10, 200});
    img.SetAt(1, 1, Rgba{10, 10, 10, 201});
    EXPECT_FALSE(HasManySiblings(RgbaView(img), 1, 1));
}

// =============================================================================
// IsAntialiased
// =============================================================================

TEST(IsAntialiasedTest, FlatRegionIsNot) {
    QImage img = SolidImage(3, 3, WHITE);
    RgbaView view(img);
    EXPECT_FALSE(IsAntialiased(view, 1, 1, view));
}

TEST(IsAntialiasedTest, SmoothedEdgePixel) {
    QImage hard = HardDiagonal(8);
    QImage smooth = SmoothedDiagonal(8);
    RgbaView a(hard);
    RgbaView b(smooth);

    // Gray sits between a black and a white flat region
    EXPECT_TRUE(IsAntialiased(b, 3, 3, a));
    // The hard edge pixel has too many equal-brightness neighbors
    EXPECT_FALSE(IsAntialiased(a, 3, 3, b));
}

TEST(IsAntialiasedTest, GradientWithoutFlatExtremesIsNot) {
    QImage img(5, 5);
    for (int32_t y = 0; y < 5; ++y) {
        for (int32_t x = 0; x < 5; ++x) {
            uint8_t v = static_cast<uint8_t>(x * 30 + y * 7);
            img.SetAt(x, y, Rgba{v, v, v, 255});
        }
    }
    RgbaView view(img);
    EXPECT_FALSE(IsAntialiased(view, 2, 2, view));
}

TEST(IsAntialiasedTest, OneSidedSlopeIsNot) {
    // Every neighbor brighter than the center
    QImage img = SolidImage(3, 3, WHITE);
    img.SetAt(1, 1, BLACK);
    RgbaView view(img);
    EXPECT_FALSE(IsAntialiased(view, 1, 1, view));
}
