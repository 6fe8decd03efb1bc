#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for PixMatch
 */

#include <cstdint>
#include <string>
#include <PixMatch/Core/Export.h>

namespace Pix::Match {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Supported 8-bit RGBA packings
 */
enum class PixelFormat {
    RGBA,               ///< Straight (non-premultiplied) alpha
    PremultipliedRGBA   ///< Color channels premultiplied by alpha
};

/**
 * @brief 8-bit RGBA pixel value (straight alpha)
 */
struct PIXMATCH_API Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;

    bool operator==(const Rgba& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Rgba& other) const {
        return !(*this == other);
    }

    bool IsOpaque() const { return a == 255; }
};

// =============================================================================
// 2D Point Types
// =============================================================================

/**
 * @brief 2D point with integer coordinates
 */
struct PIXMATCH_API Point2i {
    int32_t x = 0;
    int32_t y = 0;

    Point2i() = default;
    Point2i(int32_t x_, int32_t y_) : x(x_), y(y_) {}

    bool operator==(const Point2i& other) const {
        return x == other.x && y == other.y;
    }
};

// =============================================================================
// Size Type
// =============================================================================

/**
 * @brief 2D size with integer dimensions
 */
struct PIXMATCH_API Size2i {
    int32_t width = 0;
    int32_t height = 0;

    Size2i() = default;
    Size2i(int32_t w, int32_t h) : width(w), height(h) {}

    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool Empty() const { return width <= 0 || height <= 0; }

    bool operator==(const Size2i& other) const {
        return width == other.width && height == other.height;
    }

    bool operator!=(const Size2i& other) const {
        return !(*this == other);
    }

    /// Format as "WxH"
    std::string ToString() const {
        return std::to_string(width) + "x" + std::to_string(height);
    }
};

// =============================================================================
// Rectangle Type
// =============================================================================

/**
 * @brief Axis-aligned rectangle with integer coordinates
 */
struct PIXMATCH_API Rect2i {
    int32_t x = 0;      ///< Left
    int32_t y = 0;      ///< Top
    int32_t width = 0;
    int32_t height = 0;

    Rect2i() = default;
    Rect2i(int32_t x_, int32_t y_, int32_t w, int32_t h)
        : x(x_), y(y_), width(w), height(h) {}

    int32_t Right() const { return x + width; }
    int32_t Bottom() const { return y + height; }
    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool IsValid() const { return width >= 0 && height >= 0; }

    bool Contains(int32_t px, int32_t py) const {
        return px >= x && px < Right() && py >= y && py < Bottom();
    }

    bool Contains(const Point2i& p) const {
        return Contains(p.x, p.y);
    }

    bool operator==(const Rect2i& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
};

} // namespace Pix::Match
