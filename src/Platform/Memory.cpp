#include <PixMatch/Platform/Memory.h>

#include <cstdlib>
#include <cstring>
#include <new>

#ifdef _MSC_VER
#include <malloc.h>
#endif

namespace Pix::Match::Platform {

namespace {

void ReleaseRows(uint8_t* ptr) {
#ifdef _MSC_VER
    _aligned_free(ptr);
#else
    std::free(ptr);
#endif
}

} // anonymous namespace

PixelBuffer AllocatePixelBuffer(size_t rowBytes, size_t rows, size_t alignment) {
    PixelBuffer buffer;
    buffer.stride = AlignedSize(rowBytes, alignment);

    const size_t total = buffer.stride * rows;
    if (total == 0) {
        return buffer;
    }

    void* ptr = nullptr;
#ifdef _MSC_VER
    ptr = _aligned_malloc(total, alignment);
#else
    if (posix_memalign(&ptr, alignment, total) != 0) {
        ptr = nullptr;
    }
#endif
    if (!ptr) {
        throw std::bad_alloc();
    }

    std::memset(ptr, 0, total);
    buffer.data = std::shared_ptr<uint8_t>(static_cast<uint8_t*>(ptr), ReleaseRows);
    return buffer;
}

} // namespace Pix::Match::Platform
