#pragma once

/**
 * @file Log.h
 * @brief Library logger
 *
 * All PixMatch diagnostics go through one spdlog logger named "pixmatch",
 * writing to stderr. Default level is warn; raise it with SetLogLevel().
 *
 * Usage:
 * @code
 * Platform::SetLogLevel(spdlog::level::debug);
 * Platform::Logger()->debug("tiles: {}", tiles.size());
 * @endcode
 */

#include <PixMatch/Core/Export.h>

#include <spdlog/spdlog.h>

#include <memory>

namespace Pix::Match::Platform {

/// Name under which the logger is registered with spdlog
constexpr const char* LOGGER_NAME = "pixmatch";

/**
 * @brief Get the library logger (created on first use, thread-safe)
 *
 * If an application registered a logger named LOGGER_NAME before first
 * use, that logger is adopted instead.
 */
PIXMATCH_API std::shared_ptr<spdlog::logger> Logger();

/**
 * @brief Set the library logger level
 */
PIXMATCH_API void SetLogLevel(spdlog::level::level_enum level);

} // namespace Pix::Match::Platform
