/**
 * @file concurrency_scheduler.cpp
 * @brief Worker pool and slot semaphore
 *
 * @date 2025
 */

#include "envbox/core/concurrency_scheduler.hpp"
#include "envbox/core/exit_codes.hpp"

#include <spdlog/spdlog.h>

namespace envbox {
namespace core {

// ============================================================================
// SEMAPHORE
// ============================================================================

CountingSemaphore::CountingSemaphore(std::size_t count)
    : count_(count) {
}

void CountingSemaphore::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return count_ > 0; });
    --count_;
}

bool CountingSemaphore::TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0) {
        return false;
    }
    --count_;
    return true;
}

void CountingSemaphore::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++count_;
    }
    cv_.notify_one();
}

std::size_t CountingSemaphore::Available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

SlotGuard::SlotGuard(CountingSemaphore& semaphore)
    : semaphore_(&semaphore) {
    semaphore_->Acquire();
}

SlotGuard::SlotGuard(SlotGuard&& other) noexcept
    : semaphore_(other.semaphore_) {
    other.semaphore_ = nullptr;
}

SlotGuard::~SlotGuard() {
    if (semaphore_) {
        semaphore_->Release();
    }
}

// ============================================================================
// SCHEDULER
// ============================================================================

ConcurrencyScheduler::ConcurrencyScheduler(std::size_t max_workers)
    : max_workers_(max_workers == 0 ? 1 : max_workers)
    , slots_(max_workers_) {
    for (std::size_t i = 0; i < max_workers_; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
    spdlog::debug("Scheduler started with {} workers", max_workers_);
}

ConcurrencyScheduler::~ConcurrencyScheduler() {
    Shutdown();
}

void ConcurrencyScheduler::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        SlotGuard slot(slots_);
        ++active_tasks_;
        task();
        --active_tasks_;
        ++completed_tasks_;
    }
}

void ConcurrencyScheduler::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

SlotGuard ConcurrencyScheduler::AcquireSlot() {
    return SlotGuard(slots_);
}

std::map<JobKey, BuildResult> ConcurrencyScheduler::RunJobs(const std::vector<JobSpec>& jobs,
                                                            const JobFunction& job_fn,
                                                            const ResultCallback& on_result) {
    std::vector<std::future<BuildResult>> futures;
    futures.reserve(jobs.size());

    for (const auto& job : jobs) {
        futures.push_back(Submit([job, &job_fn, &on_result]() {
            BuildResult result;
            try {
                result = job_fn(job);
            } catch (const std::exception& e) {
                spdlog::error("Job {}@{} failed: {}", job.repository, job.commit_sha, e.what());
                result = BuildResult{};
                result.repo_name = job.repository;
                result.commit_sha = job.commit_sha;
                result.exit_code = exit_codes::UNKNOWN_FAILURE;
                result.container_logs = std::string("An unknown exception occurred: ") + e.what();
            } catch (...) {
                spdlog::error("Job {}@{} failed with a non-standard exception",
                              job.repository, job.commit_sha);
                result = BuildResult{};
                result.repo_name = job.repository;
                result.commit_sha = job.commit_sha;
                result.exit_code = exit_codes::UNKNOWN_FAILURE;
                result.container_logs = std::string("An unknown exception occurred");
            }

            if (on_result) {
                try {
                    on_result(result);
                } catch (const std::exception& e) {
                    spdlog::error("Result callback failed for {}@{}: {}",
                                  job.repository, job.commit_sha, e.what());
                }
            }
            return result;
        }));
    }

    std::map<JobKey, BuildResult> results;
    for (std::size_t i = 0; i < futures.size(); ++i) {
        BuildResult result = futures[i].get();
        const JobKey key = jobs[i].Key();
        if (results.count(key) != 0) {
            spdlog::warn("Duplicate job {}; keeping the last result", key.FileStem());
        }
        results[key] = std::move(result);
    }

    spdlog::info("Completed {} jobs", results.size());
    return results;
}

} // namespace core
} // namespace envbox
