/**
 * @file Compositor.cpp
 * @brief Diff output writer implementation
 */

#include <PixMatch/Diff/Compositor.h>
#include <PixMatch/Color/Yiq.h>

#include <algorithm>
#include <cmath>

namespace Pix::Match::Diff {

namespace {

inline uint8_t RoundToU8(double v) {
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

inline Rgba Premultiply(const Rgba& c) {
    auto mul = [&c](uint8_t v) {
        return static_cast<uint8_t>((static_cast<uint32_t>(v) * c.a + 127) / 255);
    };
    return {mul(c.r), mul(c.g), mul(c.b), c.a};
}

} // anonymous namespace

Rgba GrayPixel(const Rgba& source, double alpha) {
    double y = Color::RgbToY(source.r, source.g, source.b);
    uint8_t v = RoundToU8(Color::BlendWithWhite(y, alpha * source.a / 255.0));
    return {v, v, v, 255};
}

Compositor::Compositor(QImage& output, const DiffOptions& options)
    : data_(static_cast<uint8_t*>(output.Data()))
    , stride_(output.Stride())
    , alpha_(options.alpha)
    , diffMask_(options.diffMask)
    , aaColor_(output.IsPremultiplied() ? Premultiply(options.aaColor) : options.aaColor)
    , diffColor_(output.IsPremultiplied() ? Premultiply(options.diffColor) : options.diffColor) {
}

void Compositor::PaintAntialiased(int32_t x, int32_t y) const {
    if (!diffMask_) {
        Put(x, y, aaColor_);
    }
}

void Compositor::PaintDiff(int32_t x, int32_t y) const {
    Put(x, y, diffColor_);
}

void Compositor::PaintBackground(int32_t x, int32_t y, const Rgba& source) const {
    if (!diffMask_) {
        // Opaque gray: identical in straight and premultiplied packing
        Put(x, y, GrayPixel(source, alpha_));
    }
}

void Compositor::Put(int32_t x, int32_t y, const Rgba& value) const {
    uint8_t* p = data_ + static_cast<size_t>(y) * stride_ +
                 static_cast<size_t>(x) * RGBA_CHANNELS;
    p[0] = value.r;
    p[1] = value.g;
    p[2] = value.b;
    p[3] = value.a;
}

} // namespace Pix::Match::Diff
