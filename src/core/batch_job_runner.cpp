/**
 * @file batch_job_runner.cpp
 * @brief Implementation of the one-shot evaluation runner
 *
 * **Container setup**:
 * ```
 * image:   config.images[language]
 * command: /bin/bash -c /data/project/build.sh
 * workdir: /data/project
 * mount:   <checkout>:/data/project (rw)
 * ```
 *
 * The container timeout is a single deadline shared by `docker wait` and
 * `docker logs`; whatever wait consumes is not available to logs.
 *
 * @date 2025
 */

#include "envbox/core/batch_job_runner.hpp"
#include "envbox/core/build_scripts.hpp"
#include "envbox/core/container_handle.hpp"
#include "envbox/core/exit_codes.hpp"
#include "envbox/utils/hash_utils.hpp"
#include "envbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace envbox {
namespace core {

namespace fs = std::filesystem;
using utils::StringUtils;

namespace {

constexpr const char* kMountPath = "/data/project";

/**
 * Thrown while preparing scripts in the checkout
 */
class ScriptPreparationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void WriteExecutable(const fs::path& path, const std::string& content) {
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw ScriptPreparationError("Cannot open " + path.string() + " for writing");
        }
        file << content;
        if (!file) {
            throw ScriptPreparationError("Failed to write " + path.string());
        }
    }

    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        throw ScriptPreparationError("Cannot make " + path.string() + " executable: " + ec.message());
    }
}

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

} // anonymous namespace

std::string JobStageToString(JobStage stage) {
    switch (stage) {
        case JobStage::PENDING: return "pending";
        case JobStage::REPO_DOWNLOADED: return "repo_downloaded";
        case JobStage::SCRIPT_INJECTED: return "script_injected";
        case JobStage::CONTAINER_CREATED: return "container_created";
        case JobStage::CONTAINER_RUNNING: return "container_running";
        case JobStage::COMPLETED: return "completed";
        case JobStage::TIMED_OUT: return "timed_out";
        case JobStage::DOCKER_ERROR: return "docker_error";
        case JobStage::CREATE_CONTAINER_FAILED: return "create_container_failed";
        case JobStage::DOWNLOAD_FAILED: return "download_failed";
        case JobStage::SCRIPT_FAILED: return "script_failed";
        case JobStage::UNKNOWN_FAILURE: return "unknown_failure";
        case JobStage::CLEANED: return "cleaned";
    }
    return "unknown";
}

BatchJobRunner::BatchJobRunner(utils::ContainerClient& client,
                               RepoWorkspace& workspace,
                               EvaluationConfig config)
    : client_(client)
    , workspace_(workspace)
    , config_(std::move(config)) {
}

void BatchJobRunner::Transition(const JobKey& key, JobStage& stage, JobStage next) const {
    spdlog::debug("[{}] {} → {}", key.FileStem(), JobStageToString(stage), JobStageToString(next));
    stage = next;
    if (observer_) {
        observer_(key, next);
    }
}

// ============================================================================
// JOB EXECUTION
// ============================================================================

BuildResult BatchJobRunner::Run(const JobSpec& job) {
    const auto job_start = std::chrono::steady_clock::now();
    const JobKey key = job.Key();
    const std::string language_name = job.language.empty() ? config_.language : job.language;

    BuildResult result;
    result.repo_name = job.repository;
    result.commit_sha = job.commit_sha;

    JobStage stage = JobStage::PENDING;
    std::unique_ptr<ContainerHandle> handle;
    bool checkout_exists = false;

    spdlog::info("Processing {}@{}", job.repository, job.commit_sha);

    auto fail = [&](JobStage failed_stage, int exit_code, std::optional<std::string> logs) {
        Transition(key, stage, failed_stage);
        result.exit_code = exit_code;
        result.container_logs = std::move(logs);
    };

    try {
        std::string bootstrap;
        auto language = ParseLanguage(language_name);
        if (language) {
            if (job.bootstrap_script) {
                bootstrap = *job.bootstrap_script;
            } else {
                bootstrap = BuildScripts::BaselineBootstrap(*language);
                spdlog::info("Using default bootstrap script for {}", language_name);
            }
            bootstrap = BuildScripts::SanitizeBootstrap(bootstrap);
        }
        result.script_sha256 = bootstrap.empty() ? "" : utils::HashUtils::ComputeSHA256(bootstrap);

        spdlog::info("Downloading repository {}", job.repository);
        if (!workspace_.Download(job.repository, job.commit_sha)) {
            spdlog::error("Failed to download repository {}", job.repository);
            fail(JobStage::DOWNLOAD_FAILED, exit_codes::DOWNLOAD_FAILURE, std::nullopt);
        } else {
            checkout_exists = true;
            Transition(key, stage, JobStage::REPO_DOWNLOADED);
            const fs::path repo_path = fs::absolute(workspace_.GetRepoDirPath(job.repository, job.commit_sha));

            if (!language) {
                std::string message = "Unsupported language: " + language_name +
                                      ". Supported languages are: python, jvm, repo2run";
                spdlog::error("{}", message);
                fail(JobStage::SCRIPT_FAILED, exit_codes::SCRIPT_FAILURE, message);
            } else {
                InjectScripts(repo_path, *language, bootstrap);
                Transition(key, stage, JobStage::SCRIPT_INJECTED);

                auto image = config_.ImageFor(LanguageToString(*language));
                if (!image) {
                    throw utils::ImagePullError("No image configured for language " + language_name);
                }

                auto container_config = utils::ContainerBuilder()
                    .WithName("envbox-job-" + StringUtils::SanitizeName(key.FileStem()) +
                              "-" + utils::HashUtils::RandomToken(6))
                    .WithImage(*image)
                    .WithCommand({"/bin/bash", "-c", std::string(kMountPath) + "/" +
                                  BuildScripts::kBuildScriptName})
                    .WithWorkingDir(kMountPath)
                    .WithMount(repo_path, kMountPath, false)
                    .WithLabel("envbox.role", "job")
                    .WithLabel("envbox.repository", job.repository)
                    .Build();

                handle = std::make_unique<ContainerHandle>(client_, container_config);

                spdlog::info("Starting Docker container for {}", job.repository);
                const auto create_start = std::chrono::steady_clock::now();
                handle->Create(std::chrono::duration_cast<std::chrono::milliseconds>(
                    config_.create_container_timeout));
                Transition(key, stage, JobStage::CONTAINER_CREATED);
                spdlog::info("Container created: {} (took {} ms)", handle->Id().substr(0, 12),
                             std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - create_start).count());

                handle->Start();
                Transition(key, stage, JobStage::CONTAINER_RUNNING);

                const auto deadline = std::chrono::steady_clock::now() + config_.container_timeout;
                int exit_code = handle->Wait(Remaining(deadline));
                auto remaining = Remaining(deadline);
                if (remaining.count() == 0) {
                    throw utils::ContainerTimeout("Deadline reached before log collection");
                }
                std::string logs = handle->Logs(remaining);

                spdlog::info("Container finished with exit code {}", exit_code);
                Transition(key, stage, JobStage::COMPLETED);
                result.exit_code = exit_code;
                result.container_logs = std::move(logs);

                MergeResultFile(repo_path, *language, result);
            }
        }
    } catch (const ScriptPreparationError& e) {
        spdlog::error("Script preparation failed: {}", e.what());
        fail(JobStage::SCRIPT_FAILED, exit_codes::SCRIPT_FAILURE, std::string(e.what()));
    } catch (const utils::ContainerTimeout& e) {
        spdlog::error("Container timeout ({}s) reached: {}", config_.container_timeout.count(), e.what());
        fail(JobStage::TIMED_OUT, exit_codes::TIMEOUT,
             "Container execution timeout after " + std::to_string(config_.container_timeout.count()) +
             " seconds");
    } catch (const utils::ImagePullError& e) {
        spdlog::error("Image unavailable: {}", e.what());
        fail(JobStage::CREATE_CONTAINER_FAILED, exit_codes::CREATE_CONTAINER_FAILURE, std::string(e.what()));
    } catch (const utils::ContainerCreateTimeout& e) {
        spdlog::error("Container creation timed out: {}", e.what());
        fail(JobStage::CREATE_CONTAINER_FAILED, exit_codes::CREATE_CONTAINER_FAILURE, std::string(e.what()));
    } catch (const utils::ContainerError& e) {
        spdlog::error("Docker error: {}", e.what());
        fail(JobStage::DOCKER_ERROR, exit_codes::DOCKER_FAILURE, std::string(e.what()));
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        fail(JobStage::UNKNOWN_FAILURE, exit_codes::UNKNOWN_FAILURE,
             std::string("An unknown exception occurred: ") + e.what());
    }

    // Cleanup runs on every path
    if (handle) {
        handle->Destroy();
        spdlog::info("Container removed");
    }
    if (checkout_exists) {
        workspace_.ClearRepo(job.repository, job.commit_sha);
    }
    Transition(key, stage, JobStage::CLEANED);

    result.execution_time = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - job_start).count();

    const int final_code = result.exit_code.value_or(exit_codes::UNKNOWN_FAILURE);
    spdlog::info("[{}] exit_code={} ({}) in {:.2f}s", key.FileStem(), final_code,
                 exit_codes::Describe(final_code), result.execution_time);
    return result;
}

// ============================================================================
// SCRIPTS & RESULT FILE
// ============================================================================

void BatchJobRunner::InjectScripts(const fs::path& repo_path,
                                   Language language,
                                   const std::string& bootstrap) const {
    WriteExecutable(repo_path / BuildScripts::kBuildScriptName, BuildScripts::BuildScript(language));
    spdlog::info("Using {} build script", LanguageToString(language));

    if (!bootstrap.empty()) {
        WriteExecutable(repo_path / BuildScripts::kBootstrapScriptName, bootstrap);
        spdlog::info("Adding bootstrap script");
    }
}

void BatchJobRunner::MergeResultFile(const fs::path& repo_path,
                                     Language language,
                                     BuildResult& result) const {
    const fs::path results_path = repo_path / BuildScripts::kResultFile;

    std::ifstream file(results_path);
    if (!file) {
        spdlog::warn("No results file at {}", results_path.string());
        return;
    }

    try {
        json fields;
        file >> fields;
        result.MergeResultFile(fields);
        if (language == Language::REPO2RUN) {
            result.issues_count = CountFailedCollectors(result.extra);
        }
        spdlog::info("Found {} issues", result.issues_count);
    } catch (const json::exception& e) {
        spdlog::error("Error reading results.json: {}", e.what());
    }
}

long long BatchJobRunner::CountFailedCollectors(const json& fields) {
    if (!fields.is_object() || !fields.contains("pytest") || !fields["pytest"].is_object()) {
        return 0;
    }
    const json& pytest = fields["pytest"];
    if (!pytest.contains("collectors") || !pytest["collectors"].is_array()) {
        return 0;
    }

    long long failed = 0;
    for (const auto& collector : pytest["collectors"]) {
        if (collector.is_object() && collector.value("outcome", "") == "failed") {
            ++failed;
        }
    }
    return failed;
}

} // namespace core
} // namespace envbox
