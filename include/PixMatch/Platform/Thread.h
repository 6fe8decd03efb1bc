#pragma once

/**
 * @file Thread.h
 * @brief Worker pool and task fan-out for tiled image work
 *
 * Every parallel step in PixMatch goes through RunTasks: N independent
 * tasks, each identified by its index, joined before the call returns.
 * When the caller is already a pool worker the tasks run inline, so a
 * Diff submitted to the pool never waits on its own queue.
 *
 * @code
 * std::vector<Rect2i> tiles = ComputeTiles(w, h, 256, 256);
 * RunTasks(tiles.size(), [&](size_t i) { process(tiles[i]); });
 *
 * ParallelForRange(0, height, [&](size_t rowStart, size_t rowEnd) {
 *     for (size_t y = rowStart; y < rowEnd; ++y) processRow(y);
 * });
 * @endcode
 */

#include <PixMatch/Core/Export.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace Pix::Match::Platform {

/// Number of hardware threads, minimum 1
PIXMATCH_API size_t GetNumCores();

/// Worker count for the shared pool: one core is left to the caller
PIXMATCH_API size_t GetRecommendedThreadCount();

// ============================================================================
// ThreadPool
// ============================================================================

/**
 * @brief Fixed-size FIFO worker pool
 *
 * Instance() is the pool used by the library. Separate pools can be
 * created, e.g. to isolate a batch of work; they stop and join on
 * destruction after draining whatever is already queued.
 */
class PIXMATCH_API ThreadPool {
public:
    static ThreadPool& Instance();

    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t Size() const { return workers_.size(); }
    bool IsRunning() const { return !stop_; }

    /**
     * @brief Stop accepting tasks; queued tasks still run
     */
    void Stop();

    /**
     * @brief True when called from a worker of any ThreadPool
     */
    static bool OnWorkerThread();

    /**
     * @brief Queue a callable and get a future for its result
     * @throws std::runtime_error if the pool is stopped
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

// ============================================================================
// Task fan-out
// ============================================================================

/**
 * @brief Wait for every future, then rethrow the first failure
 *
 * All futures are waited on even when an earlier one failed, so no task
 * can still be touching caller-owned state once this returns or throws.
 */
template<typename T>
void JoinAll(std::vector<std::future<T>>& futures);

/**
 * @brief Run func(0) .. func(count - 1) on a pool and join them
 *
 * Runs inline on the calling thread when count is 1 or the caller is a
 * pool worker. If queueing fails part way, the tasks already queued are
 * waited on before the error propagates.
 */
template<typename Func>
void RunTasks(ThreadPool& pool, size_t count, Func&& func);

template<typename Func>
void RunTasks(size_t count, Func&& func) {
    RunTasks(ThreadPool::Instance(), count, std::forward<Func>(func));
}

/**
 * @brief Split [begin, end) into contiguous chunks and run func(start, end) on each
 * @param numChunks Number of chunks (0 = two per core)
 */
template<typename Func>
void ParallelForRange(size_t begin, size_t end, Func&& func, size_t numChunks = 0);

inline bool ShouldParallelize(size_t workSize, size_t minWorkPerThread = 1000) {
    return workSize >= minWorkPerThread * 2 && GetNumCores() > 1;
}

// ============================================================================
// Template Implementations
// ============================================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using ReturnType = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<ReturnType> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

template<typename T>
void JoinAll(std::vector<std::future<T>>& futures) {
    std::exception_ptr firstError;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

template<typename Func>
void RunTasks(ThreadPool& pool, size_t count, Func&& func) {
    if (count == 0) return;

    if (count == 1 || ThreadPool::OnWorkerThread()) {
        for (size_t i = 0; i < count; ++i) {
            func(i);
        }
        return;
    }

    // Reserved up front: push_back must not throw after a task is queued
    std::vector<std::future<void>> futures;
    futures.reserve(count);

    try {
        for (size_t i = 0; i < count; ++i) {
            futures.push_back(pool.Submit([&func, i]() { func(i); }));
        }
    } catch (...) {
        for (auto& f : futures) {
            f.wait();
        }
        throw;
    }

    JoinAll(futures);
}

template<typename Func>
void ParallelForRange(size_t begin, size_t end, Func&& func, size_t numChunks) {
    if (begin >= end) return;

    size_t count = end - begin;

    if (!ShouldParallelize(count, 100)) {
        func(begin, end);
        return;
    }

    if (numChunks == 0) {
        numChunks = GetNumCores() * 2;
    }
    numChunks = std::min(numChunks, count);

    size_t chunkSize = count / numChunks;
    size_t remainder = count % numChunks;

    RunTasks(numChunks, [&](size_t chunk) {
        size_t start = begin + chunk * chunkSize + std::min(chunk, remainder);
        size_t stop = start + chunkSize + (chunk < remainder ? 1 : 0);
        func(start, stop);
    });
}

} // namespace Pix::Match::Platform
