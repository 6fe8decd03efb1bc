#include <PixMatch/Core/QImage.h>
#include <PixMatch/Core/Exception.h>
#include <PixMatch/Platform/Memory.h>
#include <PixMatch/Platform/Thread.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>
#include <vector>

// stb_image for file I/O
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Pix::Match {

// =============================================================================
// Implementation class
// =============================================================================

class QImage::Impl {
public:
    int32_t width_ = 0;
    int32_t height_ = 0;
    PixelFormat format_ = PixelFormat::RGBA;
    size_t stride_ = 0;
    std::shared_ptr<uint8_t> data_;

    size_t RowBytes() const {
        return static_cast<size_t>(width_) * RGBA_CHANNELS;
    }

    void Allocate(int32_t w, int32_t h) {
        width_ = w;
        height_ = h;

        Platform::PixelBuffer buffer = Platform::AllocatePixelBuffer(
            RowBytes(), static_cast<size_t>(h));
        data_ = std::move(buffer.data);
        stride_ = buffer.stride;
    }
};

namespace {

inline uint8_t Unpremultiply(uint8_t c, uint8_t a) {
    if (a == 0) return 0;
    uint32_t v = (static_cast<uint32_t>(c) * 255 + a / 2) / a;
    return static_cast<uint8_t>(std::min<uint32_t>(v, 255));
}

} // anonymous namespace

// =============================================================================
// Constructors
// =============================================================================

QImage::QImage() : impl_(std::make_shared<Impl>()) {}

QImage::QImage(int32_t width, int32_t height, PixelFormat format)
    : impl_(std::make_shared<Impl>())
{
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive");
    }

    impl_->format_ = format;
    impl_->Allocate(width, height);
}

QImage::QImage(const QImage& other) = default;
QImage::QImage(QImage&& other) noexcept = default;
QImage::~QImage() = default;
QImage& QImage::operator=(const QImage& other) = default;
QImage& QImage::operator=(QImage&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

QImage QImage::FromFile(const std::string& path) {
    int w, h, channels;
    // Force 4 components: gray/RGB sources are expanded to opaque RGBA
    uint8_t* data = stbi_load(path.c_str(), &w, &h, &channels, RGBA_CHANNELS);

    if (!data) {
        throw IOException("Failed to load image: " + path);
    }

    QImage img;
    img.impl_->Allocate(w, h);

    size_t srcStride = img.impl_->RowBytes();
    for (int32_t y = 0; y < h; ++y) {
        std::memcpy(img.RowPtr(y), data + y * srcStride, srcStride);
    }

    stbi_image_free(data);
    return img;
}

QImage QImage::FromData(const void* data, int32_t width, int32_t height,
                        PixelFormat format) {
    QImage img(width, height, format);

    size_t srcStride = img.impl_->RowBytes();
    const uint8_t* src = static_cast<const uint8_t*>(data);
    for (int32_t y = 0; y < height; ++y) {
        std::memcpy(img.RowPtr(y), src + y * srcStride, srcStride);
    }

    return img;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t QImage::Width() const { return impl_->width_; }
int32_t QImage::Height() const { return impl_->height_; }
Size2i QImage::Size() const { return {impl_->width_, impl_->height_}; }
PixelFormat QImage::Format() const { return impl_->format_; }
bool QImage::IsPremultiplied() const { return impl_->format_ == PixelFormat::PremultipliedRGBA; }
size_t QImage::Stride() const { return impl_->stride_; }
bool QImage::Empty() const { return impl_->width_ == 0 || impl_->height_ == 0; }
bool QImage::IsValid() const { return impl_->data_ != nullptr && !Empty(); }

// =============================================================================
// Data Access
// =============================================================================

void* QImage::Data() { return impl_->data_.get(); }
const void* QImage::Data() const { return impl_->data_.get(); }

uint8_t* QImage::RowPtr(int32_t row) {
    return impl_->data_.get() + row * impl_->stride_;
}

const uint8_t* QImage::RowPtr(int32_t row) const {
    return impl_->data_.get() + row * impl_->stride_;
}

Rgba QImage::At(int32_t x, int32_t y) const {
    if (!Rect2i(0, 0, impl_->width_, impl_->height_).Contains(x, y)) {
        throw InvalidArgumentException("At(): pixel (" + std::to_string(x) + ", " +
                                       std::to_string(y) + ") outside " + Size().ToString());
    }
    const uint8_t* p = RowPtr(y) + x * RGBA_CHANNELS;
    return {p[0], p[1], p[2], p[3]};
}

void QImage::SetAt(int32_t x, int32_t y, const Rgba& value) {
    if (!Rect2i(0, 0, impl_->width_, impl_->height_).Contains(x, y)) {
        throw InvalidArgumentException("SetAt(): pixel (" + std::to_string(x) + ", " +
                                       std::to_string(y) + ") outside " + Size().ToString());
    }
    uint8_t* p = RowPtr(y) + x * RGBA_CHANNELS;
    p[0] = value.r;
    p[1] = value.g;
    p[2] = value.b;
    p[3] = value.a;
}

void QImage::Fill(const Rgba& value) {
    for (int32_t y = 0; y < impl_->height_; ++y) {
        uint8_t* row = RowPtr(y);
        for (int32_t x = 0; x < impl_->width_; ++x) {
            uint8_t* p = row + x * RGBA_CHANNELS;
            p[0] = value.r;
            p[1] = value.g;
            p[2] = value.b;
            p[3] = value.a;
        }
    }
}

// =============================================================================
// Image Operations
// =============================================================================

QImage QImage::Clone() const {
    if (Empty()) {
        return QImage();
    }

    QImage copy(impl_->width_, impl_->height_, impl_->format_);
    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memcpy(copy.RowPtr(y), RowPtr(y), impl_->RowBytes());
    }
    return copy;
}

QImage QImage::ToStraightAlpha() const {
    if (Empty() || !IsPremultiplied()) {
        return *this;
    }

    QImage straight(impl_->width_, impl_->height_, PixelFormat::RGBA);
    const int32_t width = impl_->width_;

    Platform::ParallelForRange(0, static_cast<size_t>(impl_->height_),
        [this, &straight, width](size_t rowStart, size_t rowEnd) {
            for (size_t y = rowStart; y < rowEnd; ++y) {
                const uint8_t* src = RowPtr(static_cast<int32_t>(y));
                uint8_t* dst = straight.RowPtr(static_cast<int32_t>(y));
                for (int32_t x = 0; x < width; ++x) {
                    const uint8_t* s = src + x * RGBA_CHANNELS;
                    uint8_t* d = dst + x * RGBA_CHANNELS;
                    d[0] = Unpremultiply(s[0], s[3]);
                    d[1] = Unpremultiply(s[1], s[3]);
                    d[2] = Unpremultiply(s[2], s[3]);
                    d[3] = s[3];
                }
            }
        });

    return straight;
}

bool QImage::SaveToFile(const std::string& path) const {
    if (Empty()) return false;

    // stb expects straight alpha
    QImage source = ToStraightAlpha();

    // Create contiguous buffer
    size_t srcStride = impl_->RowBytes();
    std::vector<uint8_t> buffer(srcStride * impl_->height_);

    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memcpy(buffer.data() + y * srcStride, source.RowPtr(y), srcStride);
    }

    // Determine format from extension
    if (path.size() >= 4) {
        std::string ext = path.substr(path.size() - 4);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (ext == ".jpg" || ext == "jpeg") {
            return stbi_write_jpg(path.c_str(), impl_->width_, impl_->height_,
                                  RGBA_CHANNELS, buffer.data(), 95) != 0;
        } else if (ext == ".bmp") {
            return stbi_write_bmp(path.c_str(), impl_->width_, impl_->height_,
                                  RGBA_CHANNELS, buffer.data()) != 0;
        }
    }

    // Default to PNG
    return stbi_write_png(path.c_str(), impl_->width_, impl_->height_,
                          RGBA_CHANNELS, buffer.data(), static_cast<int>(srcStride)) != 0;
}

} // namespace Pix::Match
