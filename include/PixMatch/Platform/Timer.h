#pragma once

/**
 * @file Timer.h
 * @brief High-resolution timing utilities
 *
 * Usage:
 * @code
 * Timer timer(true);
 * // ... work ...
 * double elapsed = timer.ElapsedMs();
 *
 * {
 *     ScopedTimer timer("LoadImages");
 *     // ... work ...
 * }  // Logs "LoadImages: 12.345 ms" at info level
 * @endcode
 */

#include <PixMatch/Core/Export.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace Pix::Match::Platform {

/**
 * @brief Accumulating stopwatch
 */
class PIXMATCH_API Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double>;

    /**
     * @brief Construct and optionally start timer
     * @param autoStart If true, timer starts immediately
     */
    explicit Timer(bool autoStart = false);

    /// Start or resume the timer
    void Start();

    /// Stop the timer, keeping accumulated time
    void Stop();

    /// Reset timer to zero (stopped)
    void Reset();

    bool IsRunning() const { return running_; }

    double ElapsedSeconds() const;
    double ElapsedMs() const;
    Duration Elapsed() const;

private:
    TimePoint startTime_;
    Duration accumulated_{0};
    bool running_ = false;
};

/**
 * @brief RAII timer that logs elapsed time on destruction
 */
class PIXMATCH_API ScopedTimer {
public:
    /**
     * @param name Label for the log line
     * @param logOnDestruct If true, logs elapsed time when destroyed
     */
    explicit ScopedTimer(const std::string& name, bool logOnDestruct = true);

    ~ScopedTimer();

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double ElapsedMs() const { return timer_.ElapsedMs(); }

    /// Disable logging on destruction
    void Cancel() { logOnDestruct_ = false; }

private:
    std::string name_;
    Timer timer_;
    bool logOnDestruct_;
};

} // namespace Pix::Match::Platform
