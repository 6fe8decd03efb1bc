/**
 * @file test_timer.cpp
 * @brief Unit tests for Platform/Timer.h
 */

#include <PixMatch/Platform/Timer.h>
#include <PixMatch/Platform/Log.h>
#include <gtest/gtest.h>

#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace Pix::Match::Platform;

TEST(TimerTest, DefaultConstructorIsStopped) {
    Timer timer;
    EXPECT_FALSE(timer.IsRunning());
    EXPECT_DOUBLE_EQ(timer.ElapsedMs(), 0.0);
}

TEST(TimerTest, StopFreezesElapsed) {
    Timer timer(true);
    EXPECT_TRUE(timer.IsRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    timer.Stop();

    double elapsed = timer.ElapsedMs();
    EXPECT_GE(elapsed, 5.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_DOUBLE_EQ(timer.ElapsedMs(), elapsed);
}

TEST(TimerTest, ResumeAccumulates) {
    Timer timer(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    timer.Stop();
    double first = timer.ElapsedMs();

    timer.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    timer.Stop();
    EXPECT_GT(timer.ElapsedMs(), first);

    timer.Reset();
    EXPECT_DOUBLE_EQ(timer.ElapsedMs(), 0.0);
}

TEST(ScopedTimerTest, MeasuresWhileAlive) {
    ScopedTimer timer("scope", false);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_GE(timer.ElapsedMs(), 3.0);
}

TEST(ScopedTimerTest, ReportsThroughLoggerAtInfo) {
    auto logger = Logger();
    const auto previous = logger->level();

    std::ostringstream stream;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    sink->set_pattern("%l %v");
    logger->sinks().push_back(sink);

    SetLogLevel(spdlog::level::warn);
    { ScopedTimer timer("Hidden step"); }
    SetLogLevel(spdlog::level::info);
    { ScopedTimer timer("Load images"); }

    logger->sinks().pop_back();
    SetLogLevel(previous);

    const std::string text = stream.str();
    EXPECT_EQ(text.find("Hidden step"), std::string::npos);
    EXPECT_NE(text.find("info Load images: "), std::string::npos) << text;
}
