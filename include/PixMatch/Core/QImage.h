#pragma once

/**
 * @file QImage.h
 * @brief 8-bit RGBA image class and lightweight pixel views
 */

#include <PixMatch/Core/Types.h>
#include <PixMatch/Core/Constants.h>
#include <PixMatch/Core/Export.h>

#include <memory>
#include <string>

namespace Pix::Match {

/**
 * @brief 8-bit, 4-channel image
 *
 * Key features:
 * - Straight or premultiplied alpha packing (PixelFormat)
 * - 64-byte row alignment
 * - Shallow copy by default, Clone() for deep copy
 */
class PIXMATCH_API QImage {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    QImage();

    /// Create zero-filled image with specified dimensions
    QImage(int32_t width, int32_t height, PixelFormat format = PixelFormat::RGBA);

    /// Copy constructor (shallow copy)
    QImage(const QImage& other);

    /// Move constructor
    QImage(QImage&& other) noexcept;

    /// Destructor
    ~QImage();

    /// Copy assignment (shallow copy)
    QImage& operator=(const QImage& other);

    /// Move assignment
    QImage& operator=(QImage&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Load image from file (always decoded to straight RGBA)
    static QImage FromFile(const std::string& path);

    /// Create from tightly packed RGBA data (copies data)
    static QImage FromData(const void* data, int32_t width, int32_t height,
                           PixelFormat format = PixelFormat::RGBA);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    /// Image width in pixels
    int32_t Width() const;

    /// Image height in pixels
    int32_t Height() const;

    /// Image dimensions
    Size2i Size() const;

    /// Pixel packing
    PixelFormat Format() const;

    /// Check if color channels are premultiplied by alpha
    bool IsPremultiplied() const;

    /// Row stride in bytes (includes alignment padding)
    size_t Stride() const;

    /// Check if image is empty
    bool Empty() const;

    /// Check if image is valid (allocated)
    bool IsValid() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get pointer to raw data
    void* Data();
    const void* Data() const;

    /// Get pointer to specific row
    uint8_t* RowPtr(int32_t row);
    const uint8_t* RowPtr(int32_t row) const;

    /// Get pixel at (x, y), as stored
    Rgba At(int32_t x, int32_t y) const;

    /// Set pixel at (x, y), as stored
    void SetAt(int32_t x, int32_t y, const Rgba& value);

    /// Set every pixel to value
    void Fill(const Rgba& value);

    // =========================================================================
    // Image Operations
    // =========================================================================

    /// Deep copy
    QImage Clone() const;

    /**
     * @brief Get straight-alpha version of this image
     *
     * Returns a shallow copy when the image is already straight RGBA,
     * otherwise a new un-premultiplied image.
     */
    QImage ToStraightAlpha() const;

    /// Save image to file (PNG by default, BMP/JPG by extension)
    bool SaveToFile(const std::string& path) const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

/**
 * @brief Read-only pixel view over a QImage
 *
 * Caches data pointer and stride for per-pixel access in hot loops.
 * The view does not own the pixels; the image must outlive it.
 */
class RgbaView {
public:
    explicit RgbaView(const QImage& image)
        : data_(static_cast<const uint8_t*>(image.Data()))
        , stride_(image.Stride())
        , width_(image.Width())
        , height_(image.Height()) {}

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }

    Rgba At(int32_t x, int32_t y) const {
        const uint8_t* p = data_ + static_cast<size_t>(y) * stride_ +
                           static_cast<size_t>(x) * RGBA_CHANNELS;
        return {p[0], p[1], p[2], p[3]};
    }

private:
    const uint8_t* data_;
    size_t stride_;
    int32_t width_;
    int32_t height_;
};

} // namespace Pix::Match
