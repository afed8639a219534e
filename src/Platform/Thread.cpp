/**
 * @file Thread.cpp
 * @brief Worker pool
 */

#include <CpnVision/Platform/Thread.h>

#include <algorithm>

namespace Cpn::Vision::Platform {

size_t GetNumCores() {
    return std::max(1u, std::thread::hardware_concurrency());
}

// ============================================================================
// ThreadPool
// ============================================================================

ThreadPool& ThreadPool::Instance() {
    static ThreadPool shared(GetNumCores());
    return shared;
}

ThreadPool::ThreadPool(size_t numThreads) {
    const size_t count = std::max<size_t>(numThreads, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { Run(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
    }
    wake_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::Enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            throw std::runtime_error("ThreadPool: submit during shutdown");
        }
        queue_.push_back(std::move(job));
    }
    wake_.notify_one();
}

void ThreadPool::Run() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this]() { return closing_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;     // closing and drained
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        // Exceptions end up in the packaged_task's future
        job();
    }
}

} // namespace Cpn::Vision::Platform
