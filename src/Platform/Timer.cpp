/**
 * @file Timer.cpp
 * @brief Timer implementation
 */

#include <PixMatch/Platform/Timer.h>
#include <PixMatch/Platform/Log.h>

namespace Pix::Match::Platform {

// ============================================================================
// Timer Implementation
// ============================================================================

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    if (!running_) {
        startTime_ = Clock::now();
        running_ = true;
    }
}

void Timer::Stop() {
    if (running_) {
        accumulated_ += std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
        running_ = false;
    }
}

void Timer::Reset() {
    accumulated_ = Duration{0};
    running_ = false;
}

Timer::Duration Timer::Elapsed() const {
    if (running_) {
        return accumulated_ + std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
    }
    return accumulated_;
}

double Timer::ElapsedSeconds() const {
    return Elapsed().count();
}

double Timer::ElapsedMs() const {
    return ElapsedSeconds() * 1000.0;
}

// ============================================================================
// ScopedTimer Implementation
// ============================================================================

ScopedTimer::ScopedTimer(const std::string& name, bool logOnDestruct)
    : name_(name)
    , timer_(true)
    , logOnDestruct_(logOnDestruct) {
}

ScopedTimer::~ScopedTimer() {
    if (logOnDestruct_) {
        Logger()->info("{}: {:.3f} ms", name_, timer_.ElapsedMs());
    }
}

} // namespace Pix::Match::Platform
