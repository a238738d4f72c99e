/**
 * @file batch_job_runner.hpp
 * @brief One-shot build evaluation of a repository revision
 *
 * @date 2025
 */

#pragma once

#include "envbox/core/config.hpp"
#include "envbox/core/job.hpp"
#include "envbox/core/repo_workspace.hpp"
#include "envbox/utils/container_utils.hpp"

#include <string>
#include <functional>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace envbox {
namespace core {

using json = nlohmann::json;

/**
 * @enum JobStage
 * @brief Progress of one batch job
 */
enum class JobStage {
    PENDING,
    REPO_DOWNLOADED,
    SCRIPT_INJECTED,
    CONTAINER_CREATED,
    CONTAINER_RUNNING,
    COMPLETED,                ///< Script finished (any exit code)
    TIMED_OUT,
    DOCKER_ERROR,
    CREATE_CONTAINER_FAILED,
    DOWNLOAD_FAILED,
    SCRIPT_FAILED,
    UNKNOWN_FAILURE,
    CLEANED                   ///< Container and checkout released
};

std::string JobStageToString(JobStage stage);

/**
 * @class BatchJobRunner
 * @brief Runs one build script per job in a fresh container
 *
 * **Job Flow**:
 * ```
 * PENDING
 *   ├─ download fails ──────────────→ DOWNLOAD_FAILED         (-666)
 * REPO_DOWNLOADED
 *   ├─ bad language / write fails ──→ SCRIPT_FAILED           (-555)
 * SCRIPT_INJECTED                     (build.sh, bootstrap_script.sh)
 *   ├─ pull fails / create timeout ─→ CREATE_CONTAINER_FAILED (-777)
 * CONTAINER_CREATED
 * CONTAINER_RUNNING
 *   ├─ wait + logs exceed timeout ──→ TIMED_OUT               (-127)
 *   ├─ engine error ────────────────→ DOCKER_ERROR            (-888)
 *   ├─ anything else ───────────────→ UNKNOWN_FAILURE         (-999)
 *   └─ script exits ────────────────→ COMPLETED               (script's code)
 * CLEANED                             (always: container removed, checkout cleared)
 * ```
 *
 * The exit code of the record is decided exactly once. On COMPLETED the
 * in-container `build_output/results.json` is merged into the record.
 *
 * **Thread Safety**: Run() may be called concurrently for distinct jobs if
 * the client and workspace are thread-safe.
 */
class BatchJobRunner {
public:
    using StageObserver = std::function<void(const JobKey&, JobStage)>;

    /**
     * @param client Engine client (must outlive the runner)
     * @param workspace Checkout provider (must outlive the runner)
     * @param config Images, timeouts and default language
     */
    BatchJobRunner(utils::ContainerClient& client,
                   RepoWorkspace& workspace,
                   EvaluationConfig config);

    /**
     * @brief Evaluate one job
     *
     * Never throws; every failure is encoded in the returned record.
     */
    BuildResult Run(const JobSpec& job);

    /**
     * @brief Observe stage transitions (called from the running thread)
     */
    void SetStageObserver(StageObserver observer) { observer_ = std::move(observer); }

    /**
     * @brief Number of `pytest.collectors` entries with outcome "failed"
     */
    static long long CountFailedCollectors(const json& fields);

    const EvaluationConfig& Config() const { return config_; }

private:
    void InjectScripts(const std::filesystem::path& repo_path,
                       Language language,
                       const std::string& bootstrap) const;
    void MergeResultFile(const std::filesystem::path& repo_path,
                         Language language,
                         BuildResult& result) const;
    void Transition(const JobKey& key, JobStage& stage, JobStage next) const;

    utils::ContainerClient& client_;   ///< Engine client
    RepoWorkspace& workspace_;         ///< Checkouts
    EvaluationConfig config_;          ///< Settings
    StageObserver observer_;           ///< Optional stage callback
};

} // namespace core
} // namespace envbox
