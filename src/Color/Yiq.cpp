/**
 * @file Yiq.cpp
 * @brief YIQ conversion and color difference implementation
 */

#include <PixMatch/Color/Yiq.h>

namespace Pix::Match::Color {

// =============================================================================
// Constants
// =============================================================================

namespace {

// NTSC RGB -> YIQ
constexpr double RGB_TO_YIQ[3][3] = {
    {0.29889531,  0.58662247,  0.11448223},
    {0.59597799, -0.27417610, -0.32180189},
    {0.21147017, -0.52261711,  0.31114694}
};

// Weights of the squared component differences
constexpr double WEIGHT_Y = 0.5053;
constexpr double WEIGHT_I = 0.299;
constexpr double WEIGHT_Q = 0.1957;

struct Rgbd {
    double r, g, b;
};

inline Rgbd Composite(const Rgba& p) {
    if (p.IsOpaque()) {
        return {static_cast<double>(p.r), static_cast<double>(p.g), static_cast<double>(p.b)};
    }
    double a = p.a / 255.0;
    return {BlendWithWhite(p.r, a), BlendWithWhite(p.g, a), BlendWithWhite(p.b, a)};
}

} // anonymous namespace

// =============================================================================
// Channel Conversion
// =============================================================================

double RgbToY(double r, double g, double b) {
    return r * RGB_TO_YIQ[0][0] + g * RGB_TO_YIQ[0][1] + b * RGB_TO_YIQ[0][2];
}

double RgbToI(double r, double g, double b) {
    return r * RGB_TO_YIQ[1][0] + g * RGB_TO_YIQ[1][1] + b * RGB_TO_YIQ[1][2];
}

double RgbToQ(double r, double g, double b) {
    return r * RGB_TO_YIQ[2][0] + g * RGB_TO_YIQ[2][1] + b * RGB_TO_YIQ[2][2];
}

double BlendWithWhite(double c, double a) {
    return 255.0 + (c - 255.0) * a;
}

Yiq PixelToYiq(const Rgba& pixel) {
    Rgbd c = Composite(pixel);
    return {RgbToY(c.r, c.g, c.b), RgbToI(c.r, c.g, c.b), RgbToQ(c.r, c.g, c.b)};
}

// =============================================================================
// Color Difference
// =============================================================================

double ColorDelta(const Rgba& p1, const Rgba& p2, bool yOnly) {
    if (p1 == p2) {
        return 0.0;
    }

    Rgbd c1 = Composite(p1);
    Rgbd c2 = Composite(p2);

    double y1 = RgbToY(c1.r, c1.g, c1.b);
    double y2 = RgbToY(c2.r, c2.g, c2.b);
    double y = y1 - y2;

    if (yOnly) {
        return y;
    }

    double i = RgbToI(c1.r, c1.g, c1.b) - RgbToI(c2.r, c2.g, c2.b);
    double q = RgbToQ(c1.r, c1.g, c1.b) - RgbToQ(c2.r, c2.g, c2.b);

    double delta = WEIGHT_Y * y * y + WEIGHT_I * i * i + WEIGHT_Q * q * q;

    // Sign encodes direction: negative when the second pixel is darker
    return y1 > y2 ? -delta : delta;
}

} // namespace Pix::Match::Color
