#include <gtest/gtest.h>

#include "envbox/core/batch_job_runner.hpp"
#include "envbox/core/concurrency_scheduler.hpp"
#include "envbox/core/exit_codes.hpp"
#include "envbox/utils/hash_utils.hpp"
#include "fake_container_client.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace envbox {
namespace core {
namespace {

JobSpec MakeJob(const std::string& repo, const std::string& sha = "1") {
    JobSpec job;
    job.repository = repo;
    job.commit_sha = sha;
    job.language = "python";
    return job;
}

BuildResult Succeed(const JobSpec& job) {
    BuildResult result;
    result.repo_name = job.repository;
    result.commit_sha = job.commit_sha;
    result.exit_code = 0;
    return result;
}

TEST(CountingSemaphoreTest, TryAcquireAndRelease) {
    CountingSemaphore semaphore(2);
    EXPECT_TRUE(semaphore.TryAcquire());
    EXPECT_TRUE(semaphore.TryAcquire());
    EXPECT_FALSE(semaphore.TryAcquire());
    EXPECT_EQ(semaphore.Available(), 0u);

    semaphore.Release();
    EXPECT_EQ(semaphore.Available(), 1u);
}

TEST(CountingSemaphoreTest, SlotGuardReleasesOnceAfterMove) {
    CountingSemaphore semaphore(1);
    {
        SlotGuard first(semaphore);
        EXPECT_EQ(semaphore.Available(), 0u);
        SlotGuard second(std::move(first));
        EXPECT_EQ(semaphore.Available(), 0u);
    }
    EXPECT_EQ(semaphore.Available(), 1u);
}

TEST(ConcurrencySchedulerTest, ZeroWorkersBecomesOne) {
    ConcurrencyScheduler scheduler(0);
    EXPECT_EQ(scheduler.MaxWorkers(), 1u);
}

TEST(ConcurrencySchedulerTest, RunJobsRespectsBound) {
    ConcurrencyScheduler scheduler(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<JobSpec> jobs;
    for (int i = 0; i < 6; ++i) {
        jobs.push_back(MakeJob("owner/repo" + std::to_string(i)));
    }

    auto results = scheduler.RunJobs(jobs, [&](const JobSpec& job) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        --running;
        return Succeed(job);
    });

    EXPECT_EQ(results.size(), 6u);
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST(ConcurrencySchedulerTest, FailingJobDoesNotAffectOthers) {
    ConcurrencyScheduler scheduler(3);
    std::mutex mutex;
    std::vector<std::string> reported;

    auto results = scheduler.RunJobs(
        {MakeJob("a/ok"), MakeJob("b/boom"), MakeJob("c/ok")},
        [](const JobSpec& job) -> BuildResult {
            if (job.repository == "b/boom") {
                throw std::runtime_error("runner exploded");
            }
            return Succeed(job);
        },
        [&](const BuildResult& result) {
            std::lock_guard<std::mutex> lock(mutex);
            reported.push_back(result.repo_name);
        });

    ASSERT_EQ(results.size(), 3u);
    const auto& failed = results.at(JobKey{"b/boom", "1"});
    EXPECT_EQ(*failed.exit_code, exit_codes::UNKNOWN_FAILURE);
    EXPECT_EQ(*failed.container_logs, "An unknown exception occurred: runner exploded");
    EXPECT_EQ(*results.at(JobKey{"a/ok", "1"}).exit_code, 0);
    EXPECT_EQ(*results.at(JobKey{"c/ok", "1"}).exit_code, 0);
    EXPECT_EQ(reported.size(), 3u);
}

TEST(ConcurrencySchedulerTest, ThrowingCallbackIsContained) {
    ConcurrencyScheduler scheduler(1);

    auto results = scheduler.RunJobs({MakeJob("a/one")}, Succeed,
                                     [](const BuildResult&) { throw std::runtime_error("disk full"); });

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(*results.begin()->second.exit_code, 0);
}

TEST(ConcurrencySchedulerTest, SubmitReturnsValuesAndExceptions) {
    ConcurrencyScheduler scheduler(2);

    auto value = scheduler.Submit([] { return 42; });
    auto failure = scheduler.Submit([]() -> int { throw std::logic_error("nope"); });

    EXPECT_EQ(value.get(), 42);
    EXPECT_THROW(failure.get(), std::logic_error);
}

TEST(ConcurrencySchedulerTest, SubmitAfterShutdownThrows) {
    ConcurrencyScheduler scheduler(1);
    scheduler.Shutdown();
    scheduler.Shutdown();
    EXPECT_THROW(scheduler.Submit([] { return 0; }), std::runtime_error);
}

TEST(ConcurrencySchedulerTest, HeldSlotBlocksPoolTasks) {
    ConcurrencyScheduler scheduler(1);
    std::future<int> pending;
    {
        SlotGuard slot = scheduler.AcquireSlot();
        pending = scheduler.Submit([] { return 7; });
        EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);
    }
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(pending.get(), 7);
}

TEST(ConcurrencySchedulerTest, DuplicateJobsKeepOneResult) {
    ConcurrencyScheduler scheduler(2);
    auto results = scheduler.RunJobs({MakeJob("a/one"), MakeJob("a/one")}, Succeed);
    EXPECT_EQ(results.size(), 1u);
}

/// One slow and one fast job through the real runner: the timeout of one
/// must not leak into the other.
TEST(ConcurrencySchedulerTest, TimeoutIsolatedBetweenJobs) {
    fs::path root = fs::temp_directory_path() / ("envbox_sched_" + utils::HashUtils::RandomToken(8));
    for (const char* stem : {"owner__slow@1", "owner__fast@1"}) {
        fs::create_directories(root / "archives" / stem);
        std::ofstream(root / "archives" / stem / "README.md") << "# repo\n";
    }

    test_support::FakeContainerClient client;
    client.on_wait = [](const utils::ContainerConfig& config) {
        if (config.name.find("slow") != std::string::npos) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        }
        return 0;
    };

    EvaluationConfig config;
    config.container_timeout = std::chrono::seconds(1);
    ArchiveRepoWorkspace workspace(root / "archives", root / "repos");
    BatchJobRunner runner(client, workspace, config);
    ConcurrencyScheduler scheduler(2);

    auto results = scheduler.RunJobs({MakeJob("owner/slow"), MakeJob("owner/fast")},
                                     [&](const JobSpec& job) { return runner.Run(job); });

    EXPECT_EQ(*results.at(JobKey{"owner/slow", "1"}).exit_code, exit_codes::TIMEOUT);
    EXPECT_EQ(*results.at(JobKey{"owner/fast", "1"}).exit_code, 0);
    EXPECT_EQ(client.LiveContainers(), 0u);

    std::error_code ec;
    fs::remove_all(root, ec);
}

} // namespace
} // namespace core
} // namespace envbox
