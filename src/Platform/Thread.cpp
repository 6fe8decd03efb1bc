/**
 * @file Thread.cpp
 * @brief Worker pool implementation
 */

#include <PixMatch/Platform/Thread.h>

namespace Pix::Match::Platform {

namespace {

thread_local bool tOnWorker = false;

} // anonymous namespace

size_t GetNumCores() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? static_cast<size_t>(cores) : 1;
}

size_t GetRecommendedThreadCount() {
    size_t cores = GetNumCores();
    return cores > 1 ? cores - 1 : 1;
}

// ============================================================================
// ThreadPool
// ============================================================================

ThreadPool& ThreadPool::Instance() {
    static ThreadPool instance(GetRecommendedThreadCount());
    return instance;
}

ThreadPool::ThreadPool(size_t numThreads) {
    numThreads = std::max<size_t>(numThreads, 1);

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool() {
    Stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

bool ThreadPool::OnWorkerThread() {
    return tOnWorker;
}

void ThreadPool::WorkerThread() {
    tOnWorker = true;

    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            // Drain the queue before exiting
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

} // namespace Pix::Match::Platform
