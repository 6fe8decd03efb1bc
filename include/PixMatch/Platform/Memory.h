#pragma once

/**
 * @file Memory.h
 * @brief Row-aligned pixel storage
 */

#include <PixMatch/Core/Constants.h>
#include <PixMatch/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace Pix::Match::Platform {

inline bool IsAligned(const void* ptr, size_t alignment = MEMORY_ALIGNMENT) {
    return (reinterpret_cast<uintptr_t>(ptr) % alignment) == 0;
}

/// Round up to a multiple of alignment (power of two)
inline size_t AlignedSize(size_t size, size_t alignment = MEMORY_ALIGNMENT) {
    return (size + alignment - 1) & ~(alignment - 1);
}

/**
 * @brief Shared, zero-filled pixel rows
 *
 * Every row starts on an alignment boundary; stride is the distance in
 * bytes between rows. Copies share the same storage.
 */
struct PixelBuffer {
    std::shared_ptr<uint8_t> data;
    size_t stride = 0;
};

/**
 * @brief Allocate rows x rowBytes of aligned, zeroed storage
 * @throws std::bad_alloc if the allocation fails
 */
PIXMATCH_API PixelBuffer AllocatePixelBuffer(size_t rowBytes, size_t rows,
                                             size_t alignment = MEMORY_ALIGNMENT);

} // namespace Pix::Match::Platform
