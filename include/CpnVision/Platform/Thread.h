#pragma once

/**
 * @file Thread.h
 * @brief Worker pool for per-image and per-label-map batch work
 *
 * @code
 * // Results keep input order
 * auto bundles = ParallelMap(labelMaps.size(), [&](size_t i) {
 *     return generator.Generate(labelMaps[i]);
 * });
 * @endcode
 *
 * A failing item does not cancel the others: ParallelMap waits for every
 * item of the call, then rethrows the first failure in index order.
 */

#include <CpnVision/Core/Export.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace Cpn::Vision::Platform {

/**
 * @brief Number of hardware threads, at least 1
 */
CPNVISION_API size_t GetNumCores();

// ============================================================================
// ThreadPool
// ============================================================================

/**
 * @brief Fixed set of workers draining a FIFO queue
 *
 * The shared pool (Instance()) has GetNumCores() workers. Destruction runs
 * the queued tasks before joining.
 */
class CPNVISION_API ThreadPool {
public:
    static ThreadPool& Instance();

    /// numThreads is raised to 1
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t Size() const { return workers_.size(); }

    /**
     * @brief Queue func(); the future carries its result or exception
     * @throws std::runtime_error if the pool is shutting down
     */
    template<typename Func>
    std::future<std::invoke_result_t<Func>> Submit(Func&& func);

private:
    void Enqueue(std::function<void()> job);
    void Run();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool closing_ = false;
};

/**
 * @brief func(0) ... func(count - 1) on the pool, results in index order
 *
 * Runs inline when count < 2 or the pool has a single worker.
 */
template<typename Func>
auto ParallelMap(size_t count, Func&& func, ThreadPool& pool = ThreadPool::Instance())
    -> std::vector<std::invoke_result_t<Func&, size_t>>;

// ============================================================================
// Template Implementations
// ============================================================================

template<typename Func>
std::future<std::invoke_result_t<Func>> ThreadPool::Submit(Func&& func) {
    using Result = std::invoke_result_t<Func>;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(func));
    std::future<Result> future = task->get_future();
    Enqueue([task]() { (*task)(); });
    return future;
}

template<typename Func>
auto ParallelMap(size_t count, Func&& func, ThreadPool& pool)
    -> std::vector<std::invoke_result_t<Func&, size_t>>
{
    using Result = std::invoke_result_t<Func&, size_t>;

    std::vector<Result> results;
    results.reserve(count);

    if (count < 2 || pool.Size() < 2) {
        for (size_t i = 0; i < count; ++i) {
            results.push_back(func(i));
        }
        return results;
    }

    std::vector<std::future<Result>> pending;
    pending.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        pending.push_back(pool.Submit([&func, i]() { return func(i); }));
    }

    // Every item finishes before the first failure propagates
    for (auto& f : pending) {
        f.wait();
    }
    for (auto& f : pending) {
        results.push_back(f.get());
    }
    return results;
}

} // namespace Cpn::Vision::Platform
