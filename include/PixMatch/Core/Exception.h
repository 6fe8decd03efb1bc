#pragma once

#include <PixMatch/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for PixMatch
 */

#include <stdexcept>
#include <string>

namespace Pix::Match {

/**
 * @brief Base exception class for PixMatch
 */
class PIXMATCH_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class PIXMATCH_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief One or more images passed to a comparison have no pixels
 */
class PIXMATCH_API EmptyImageException : public Exception {
public:
    explicit EmptyImageException(const std::string& message)
        : Exception("Image is empty: " + message) {}
};

/**
 * @brief Images passed to a comparison do not share the same bounds
 */
class PIXMATCH_API ImageSizeMismatchException : public Exception {
public:
    explicit ImageSizeMismatchException(const std::string& message)
        : Exception("Image size mismatch: " + message) {}
};

/**
 * @brief File I/O exception
 */
class PIXMATCH_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

} // namespace Pix::Match
