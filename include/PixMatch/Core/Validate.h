#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for PixMatch
 *
 * Design principles:
 * - Checks run before any pixel work, so a failing call has no side effects
 * - Consistent error message format: "<funcName>: <detail>"
 *
 * Layered API:
 * - RequireImagesNonEmpty(): every image has pixels
 * - RequireSameSize(): adjacent images share bounds
 * - RequireRange() / RequirePositive(): scalar parameters
 */

#include <PixMatch/Core/Export.h>
#include <PixMatch/Core/Exception.h>
#include <PixMatch/Core/QImage.h>

#include <cstdio>
#include <initializer_list>
#include <string>
#include <vector>

namespace Pix::Match::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int32_t val) {
    return std::to_string(val);
}

/// Name of the i-th image of a comparison call
inline std::string ImageName(size_t index) {
    switch (index) {
        case 0:  return "first img";
        case 1:  return "second img";
        case 2:  return "output img";
        default: return std::to_string(index) + " img";
    }
}

inline std::string Join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace Detail

// =============================================================================
// Image Validation
// =============================================================================

/**
 * @brief Check every image has pixels
 *
 * Images are named by position: first img, second img, output img.
 *
 * @param images Images in call order
 * @param funcName Function name for error messages
 * @throws EmptyImageException listing every empty image
 */
inline void RequireImagesNonEmpty(std::initializer_list<const QImage*> images,
                                  const char* funcName) {
    std::vector<std::string> empty;
    size_t index = 0;
    for (const QImage* image : images) {
        if (image == nullptr || image->Empty() || !image->IsValid()) {
            empty.push_back(Detail::ImageName(index));
        }
        ++index;
    }

    if (!empty.empty()) {
        throw EmptyImageException(
            std::string(funcName) + ": images: " + Detail::Join(empty, ", "));
    }
}

/**
 * @brief Check adjacent images share identical bounds
 *
 * Comparing each image with its successor is enough to detect any
 * mismatch among the whole list.
 *
 * @param images Images in call order (must be non-null)
 * @param funcName Function name for error messages
 * @throws ImageSizeMismatchException listing every mismatching pair
 */
inline void RequireSameSize(std::initializer_list<const QImage*> images,
                            const char* funcName) {
    std::vector<const QImage*> list(images);
    std::vector<std::string> mismatches;

    for (size_t i = 0; i + 1 < list.size(); ++i) {
        Size2i a = list[i]->Size();
        Size2i b = list[i + 1]->Size();
        if (a != b) {
            mismatches.push_back(
                "\"" + Detail::ImageName(i) + "\" (" + a.ToString() + ") != \"" +
                Detail::ImageName(i + 1) + "\" (" + b.ToString() + ")");
        }
    }

    if (!mismatches.empty()) {
        throw ImageSizeMismatchException(
            std::string(funcName) + ": images: " + Detail::Join(mismatches, ", "));
    }
}

// =============================================================================
// Parameter Validation
// =============================================================================

/**
 * @brief Check value lies in [minVal, maxVal]
 * @throws InvalidArgumentException if outside (NaN included)
 */
inline void RequireRange(double value, double minVal, double maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Check value > 0
 * @throws InvalidArgumentException if not positive
 */
inline void RequirePositive(int32_t value, const char* paramName, const char* funcName) {
    if (value <= 0) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

} // namespace Pix::Match::Validate
