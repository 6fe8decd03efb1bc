/**
 * @file test_memory.cpp
 * @brief Unit tests for Platform/Memory.h
 */

#include <PixMatch/Platform/Memory.h>
#include <gtest/gtest.h>

using namespace Pix::Match;
using namespace Pix::Match::Platform;

TEST(MemoryTest, AlignedSizeRoundsUp) {
    EXPECT_EQ(AlignedSize(0), 0u);
    EXPECT_EQ(AlignedSize(1), MEMORY_ALIGNMENT);
    EXPECT_EQ(AlignedSize(MEMORY_ALIGNMENT), MEMORY_ALIGNMENT);
    EXPECT_EQ(AlignedSize(MEMORY_ALIGNMENT + 1), 2 * MEMORY_ALIGNMENT);
    EXPECT_EQ(AlignedSize(5, 4), 8u);
}

TEST(MemoryTest, PixelBufferRowsAreAlignedAndZeroed) {
    const size_t rowBytes = 7 * RGBA_CHANNELS;
    PixelBuffer buffer = AllocatePixelBuffer(rowBytes, 5);

    ASSERT_NE(buffer.data, nullptr);
    EXPECT_EQ(buffer.stride, AlignedSize(rowBytes));
    for (size_t row = 0; row < 5; ++row) {
        const uint8_t* p = buffer.data.get() + row * buffer.stride;
        EXPECT_TRUE(IsAligned(p));
        for (size_t i = 0; i < buffer.stride; ++i) {
            EXPECT_EQ(p[i], 0) << "row " << row << " byte " << i;
        }
    }
}

TEST(MemoryTest, EmptyPixelBufferHasNoStorage) {
    PixelBuffer buffer = AllocatePixelBuffer(16, 0);
    EXPECT_EQ(buffer.data, nullptr);
}

TEST(MemoryTest, CopiesShareStorage) {
    PixelBuffer first = AllocatePixelBuffer(8, 2);
    PixelBuffer second = first;
    second.data.get()[3] = 42;
    EXPECT_EQ(first.data.get()[3], 42);
    EXPECT_EQ(first.data.use_count(), 2);
}
