/**
 * @file Log.cpp
 * @brief Library logger implementation
 */

#include <PixMatch/Platform/Log.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Pix::Match::Platform {

std::shared_ptr<spdlog::logger> Logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(spdlog::level::warn);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
    Logger()->set_level(level);
}

} // namespace Pix::Match::Platform
