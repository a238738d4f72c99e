#include <gtest/gtest.h>

#include "envbox/core/batch_job_runner.hpp"
#include "envbox/core/build_scripts.hpp"
#include "envbox/core/exit_codes.hpp"
#include "envbox/utils/hash_utils.hpp"
#include "fake_container_client.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace envbox {
namespace core {
namespace {

class BatchJobRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("envbox_runner_" + utils::HashUtils::RandomToken(8));
        archives_ = root_ / "archives";
        fs::create_directories(archives_ / "owner__repo@abc");
        std::ofstream(archives_ / "owner__repo@abc" / "setup.py") << "from setuptools import setup\n";

        config_.container_timeout = std::chrono::seconds(30);
        config_.create_container_timeout = std::chrono::seconds(30);

        workspace_ = std::make_unique<ArchiveRepoWorkspace>(archives_, root_ / "repos");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    BuildResult Run(const JobSpec& job) {
        BatchJobRunner runner(client_, *workspace_, config_);
        return runner.Run(job);
    }

    static JobSpec MakeJob(const std::string& language = "python") {
        JobSpec job;
        job.repository = "owner/repo";
        job.commit_sha = "abc";
        job.language = language;
        return job;
    }

    /// Host directory bound into the job container
    static fs::path HostRepo(const utils::ContainerConfig& config) {
        return config.mounts.at(0).host_path;
    }

    static void WriteResultFile(const utils::ContainerConfig& config, const std::string& content) {
        fs::path path = HostRepo(config) / BuildScripts::kResultFile;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    static std::string ReadFile(const fs::path& path) {
        std::ifstream file(path);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    test_support::FakeContainerClient client_;
    EvaluationConfig config_;
    std::unique_ptr<ArchiveRepoWorkspace> workspace_;
    fs::path root_;
    fs::path archives_;
};

TEST_F(BatchJobRunnerTest, SuccessfulJobMergesResultFile) {
    bool scripts_present = false;
    client_.on_wait = [&](const utils::ContainerConfig& config) {
        auto build = HostRepo(config) / BuildScripts::kBuildScriptName;
        auto bootstrap = HostRepo(config) / BuildScripts::kBootstrapScriptName;
        scripts_present = fs::exists(build) && fs::exists(bootstrap) &&
                          (fs::status(build).permissions() & fs::perms::owner_exec) != fs::perms::none;
        WriteResultFile(config, R"({"issues_count": 4, "missing_imports": ["numpy"], "exit_code": 99})");
        return 0;
    };

    auto result = Run(MakeJob());

    EXPECT_TRUE(scripts_present);
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.issues_count, 4);
    EXPECT_EQ(result.extra.at("missing_imports").at(0), "numpy");
    EXPECT_EQ(*result.container_logs, "build log\n");
    EXPECT_EQ(result.repo_name, "owner/repo");
    EXPECT_EQ(result.commit_sha, "abc");
    EXPECT_GT(result.execution_time, 0.0);
    EXPECT_EQ(result.script_sha256,
              utils::HashUtils::ComputeSHA256(
                  BuildScripts::SanitizeBootstrap(BuildScripts::BaselineBootstrap(Language::PYTHON))));

    // Container and checkout are released
    EXPECT_EQ(client_.LiveContainers(), 0u);
    EXPECT_FALSE(fs::exists(workspace_->GetRepoDirPath("owner/repo", "abc")));
}

TEST_F(BatchJobRunnerTest, ContainerConfiguration) {
    Run(MakeJob("jvm"));

    auto config = client_.LastConfig();
    EXPECT_EQ(config.image, "ghcr.io/jetbrains-research/envbench-jvm");
    EXPECT_EQ(config.working_dir, "/data/project");
    EXPECT_EQ(config.command,
              (std::vector<std::string>{"/bin/bash", "-c", "/data/project/build.sh"}));
    ASSERT_EQ(config.mounts.size(), 1u);
    EXPECT_EQ(config.mounts[0].container_path, "/data/project");
    EXPECT_FALSE(config.mounts[0].read_only);
    EXPECT_EQ(config.name.rfind("envbox-job-owner__repo_abc-", 0), 0u);
}

TEST_F(BatchJobRunnerTest, NonZeroExitIsRecorded) {
    client_.on_wait = [](const utils::ContainerConfig&) { return 1; };
    client_.logs = "Failed to get valid pyright output\n";

    auto result = Run(MakeJob());

    EXPECT_EQ(*result.exit_code, 1);
    EXPECT_EQ(*result.container_logs, "Failed to get valid pyright output\n");
    EXPECT_EQ(result.issues_count, 0);
}

TEST_F(BatchJobRunnerTest, MissingRepositoryIsDownloadFailure) {
    JobSpec job = MakeJob();
    job.repository = "owner/missing";

    auto result = Run(job);

    EXPECT_EQ(*result.exit_code, exit_codes::DOWNLOAD_FAILURE);
    EXPECT_FALSE(result.container_logs.has_value());
    EXPECT_EQ(client_.creates.load(), 0);
}

TEST_F(BatchJobRunnerTest, ContainerTimeout) {
    config_.container_timeout = std::chrono::seconds(1);
    client_.on_wait = [](const utils::ContainerConfig&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        return 0;
    };

    auto result = Run(MakeJob());

    EXPECT_EQ(*result.exit_code, exit_codes::TIMEOUT);
    EXPECT_EQ(*result.container_logs, "Container execution timeout after 1 seconds");
    EXPECT_EQ(client_.LiveContainers(), 0u);
}

TEST_F(BatchJobRunnerTest, ImagePullFailure) {
    client_.image_present = false;
    client_.pull_fails = true;

    auto result = Run(MakeJob());

    EXPECT_EQ(*result.exit_code, exit_codes::CREATE_CONTAINER_FAILURE);
    EXPECT_NE(result.container_logs->find("not found"), std::string::npos);
    EXPECT_FALSE(fs::exists(workspace_->GetRepoDirPath("owner/repo", "abc")));
}

TEST_F(BatchJobRunnerTest, CreateTimeout) {
    client_.create_times_out = true;

    auto result = Run(MakeJob());

    EXPECT_EQ(*result.exit_code, exit_codes::CREATE_CONTAINER_FAILURE);
}

TEST_F(BatchJobRunnerTest, StartFailureIsDockerFailure) {
    client_.start_fails = true;

    auto result = Run(MakeJob());

    EXPECT_EQ(*result.exit_code, exit_codes::DOCKER_FAILURE);
    EXPECT_NE(result.container_logs->find("Cannot start container"), std::string::npos);
    EXPECT_EQ(client_.LiveContainers(), 0u);
}

TEST_F(BatchJobRunnerTest, UnconfiguredImageIsCreateFailure) {
    config_.images.erase("python");

    auto result = Run(MakeJob());

    EXPECT_EQ(*result.exit_code, exit_codes::CREATE_CONTAINER_FAILURE);
    EXPECT_EQ(client_.creates.load(), 0);
}

TEST_F(BatchJobRunnerTest, UnsupportedLanguageIsScriptFailure) {
    auto result = Run(MakeJob("rust"));

    EXPECT_EQ(*result.exit_code, exit_codes::SCRIPT_FAILURE);
    EXPECT_EQ(*result.container_logs,
              "Unsupported language: rust. Supported languages are: python, jvm, repo2run");
    EXPECT_EQ(client_.creates.load(), 0);
    EXPECT_TRUE(result.script_sha256.empty());
}

TEST_F(BatchJobRunnerTest, DefaultLanguageFromConfig) {
    config_.language = "jvm";

    Run(MakeJob(""));

    EXPECT_EQ(client_.LastConfig().image, "ghcr.io/jetbrains-research/envbench-jvm");
}

TEST_F(BatchJobRunnerTest, UnexpectedExceptionIsUnknownFailure) {
    client_.on_wait = [](const utils::ContainerConfig&) -> int {
        throw std::out_of_range("bad wait payload");
    };

    auto result = Run(MakeJob());

    EXPECT_EQ(*result.exit_code, exit_codes::UNKNOWN_FAILURE);
    EXPECT_EQ(*result.container_logs, "An unknown exception occurred: bad wait payload");
    EXPECT_EQ(client_.LiveContainers(), 0u);
}

TEST_F(BatchJobRunnerTest, BootstrapScriptIsSanitized) {
    std::string bootstrap_seen;
    client_.on_wait = [&](const utils::ContainerConfig& config) {
        bootstrap_seen = ReadFile(HostRepo(config) / BuildScripts::kBootstrapScriptName);
        return 0;
    };

    JobSpec job = MakeJob("jvm");
    job.bootstrap_script = "sdk use java 17\nmvn compile\n./gradlew test\necho done";
    auto result = Run(job);

    EXPECT_EQ(bootstrap_seen, "sdk use java 17\necho done");
    EXPECT_EQ(result.script_sha256, utils::HashUtils::ComputeSHA256(bootstrap_seen));
}

TEST_F(BatchJobRunnerTest, Repo2RunCountsFailedCollectors) {
    client_.on_wait = [](const utils::ContainerConfig& config) {
        WriteResultFile(config, R"({"pytest": {"collectors": [
            {"nodeid": "a", "outcome": "passed"},
            {"nodeid": "b", "outcome": "failed"},
            {"nodeid": "c", "outcome": "failed"}
        ]}})");
        return 0;
    };

    auto result = Run(MakeJob("repo2run"));

    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.issues_count, 2);
    EXPECT_TRUE(result.extra.contains("pytest"));
}

TEST_F(BatchJobRunnerTest, MalformedResultFileKeepsExitCode) {
    client_.on_wait = [](const utils::ContainerConfig& config) {
        WriteResultFile(config, "{ truncated");
        return 0;
    };

    auto result = Run(MakeJob());

    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.issues_count, 0);
    EXPECT_TRUE(result.extra.empty());
}

TEST_F(BatchJobRunnerTest, StageObserverSeesLifecycle) {
    std::vector<JobStage> stages;
    BatchJobRunner runner(client_, *workspace_, config_);
    runner.SetStageObserver([&](const JobKey& key, JobStage stage) {
        EXPECT_EQ(key.repository, "owner/repo");
        stages.push_back(stage);
    });

    runner.Run(MakeJob());

    EXPECT_EQ(stages, (std::vector<JobStage>{
        JobStage::REPO_DOWNLOADED, JobStage::SCRIPT_INJECTED, JobStage::CONTAINER_CREATED,
        JobStage::CONTAINER_RUNNING, JobStage::COMPLETED, JobStage::CLEANED}));
    EXPECT_EQ(JobStageToString(JobStage::TIMED_OUT), "timed_out");
}

TEST_F(BatchJobRunnerTest, CountFailedCollectorsIgnoresMalformedReports) {
    EXPECT_EQ(BatchJobRunner::CountFailedCollectors(json::object()), 0);
    EXPECT_EQ(BatchJobRunner::CountFailedCollectors(json{{"pytest", "oops"}}), 0);
    EXPECT_EQ(BatchJobRunner::CountFailedCollectors(json{{"pytest", {{"collectors", 3}}}}), 0);
}

} // namespace
} // namespace core
} // namespace envbox
