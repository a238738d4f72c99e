/**
 * @file concurrency_scheduler.hpp
 * @brief Bounded worker pool for batch jobs and interactive sessions
 *
 * @date 2025
 */

#pragma once

#include "envbox/core/job.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace envbox {
namespace core {

/**
 * @class CountingSemaphore
 * @brief Blocking counting semaphore
 */
class CountingSemaphore {
public:
    explicit CountingSemaphore(std::size_t count);

    void Acquire();
    bool TryAcquire();
    void Release();

    std::size_t Available() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t count_;
};

/**
 * @class SlotGuard
 * @brief RAII ownership of one scheduler slot
 */
class SlotGuard {
public:
    explicit SlotGuard(CountingSemaphore& semaphore);
    ~SlotGuard();

    SlotGuard(SlotGuard&& other) noexcept;
    SlotGuard& operator=(SlotGuard&&) = delete;
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    CountingSemaphore* semaphore_;  ///< nullptr once moved from
};

/**
 * @class ConcurrencyScheduler
 * @brief Runs at most `max_workers` jobs or sessions at a time
 *
 * **Slot Model**:
 * ```
 *              ┌──────────── max_workers slots ────────────┐
 * Submit() ──→ queue ──→ worker thread ─ holds slot ─→ task
 * AcquireSlot() ─────────────────────── holds slot ─→ interactive session
 * ```
 *
 * Pool tasks and AcquireSlot() callers draw from the same semaphore, so
 * sessions opened next to a running batch reduce its parallelism rather than
 * exceed the bound. A task must not call AcquireSlot() itself.
 *
 * **Usage Example**:
 * @code
 * ConcurrencyScheduler scheduler(4);
 * auto results = scheduler.RunJobs(jobs, [&](const JobSpec& job) {
 *     return runner.Run(job);
 * });
 * @endcode
 */
class ConcurrencyScheduler {
public:
    using JobFunction = std::function<BuildResult(const JobSpec&)>;
    using ResultCallback = std::function<void(const BuildResult&)>;

    /**
     * @param max_workers Slot count (0 is treated as 1)
     */
    explicit ConcurrencyScheduler(std::size_t max_workers);

    /**
     * @brief Finishes queued tasks, then joins the workers
     */
    ~ConcurrencyScheduler();

    ConcurrencyScheduler(const ConcurrencyScheduler&) = delete;
    ConcurrencyScheduler& operator=(const ConcurrencyScheduler&) = delete;

    /**
     * @brief Queue a callable
     * @return Future of its result; an exception it throws is stored there
     * @throws std::runtime_error after Shutdown()
     */
    template <typename F>
    auto Submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto packaged = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));
        std::future<ReturnType> future = packaged->get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stopping_) {
                throw std::runtime_error("Submit on stopped scheduler");
            }
            tasks_.emplace([packaged]() { (*packaged)(); });
        }
        condition_.notify_one();
        return future;
    }

    /**
     * @brief Run every job and collect the results by key
     *
     * An exception escaping @p job_fn becomes an UNKNOWN_FAILURE record for
     * that job only. @p on_result is called from the worker thread as each
     * job finishes.
     */
    std::map<JobKey, BuildResult> RunJobs(const std::vector<JobSpec>& jobs,
                                          const JobFunction& job_fn,
                                          const ResultCallback& on_result = nullptr);

    /**
     * @brief Block until a slot is free and hold it for the guard's lifetime
     */
    SlotGuard AcquireSlot();

    /**
     * @brief Stop accepting tasks, drain the queue, join the workers
     */
    void Shutdown();

    std::size_t MaxWorkers() const { return max_workers_; }
    std::size_t ActiveTasks() const { return active_tasks_.load(); }
    std::size_t CompletedTasks() const { return completed_tasks_.load(); }

private:
    void WorkerLoop();

    std::size_t max_workers_;                     ///< Slot count
    CountingSemaphore slots_;                     ///< Shared bound
    std::vector<std::thread> workers_;            ///< Pool threads
    std::queue<std::function<void()>> tasks_;     ///< Pending tasks
    std::mutex queue_mutex_;                      ///< Guards tasks_ and stopping_
    std::condition_variable condition_;           ///< Signals new tasks
    bool stopping_{false};                        ///< Shutdown() requested
    std::atomic<std::size_t> active_tasks_{0};    ///< Tasks running now
    std::atomic<std::size_t> completed_tasks_{0}; ///< Tasks finished
};

} // namespace core
} // namespace envbox
