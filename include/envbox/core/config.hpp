/**
 * @file config.hpp
 * @brief Configuration of evaluation runs and interactive sessions
 *
 * Both configurations are read from JSON. Every key is optional; missing
 * keys keep the defaults listed below.
 *
 * **Evaluation config layout**:
 * ```json
 * {
 *   "language": "python",
 *   "docker": {
 *     "create_container_timeout": 180,
 *     "container_timeout": 600,
 *     "image": { "python": "...", "jvm": "...", "repo2run": "..." }
 *   },
 *   "operation": {
 *     "dirs": { "repo_data": "...", "json_results": "...", "repo_archives": "..." },
 *     "pool_config": { "max_workers": 4 },
 *     "rewrite_results": false
 *   },
 *   "input": {
 *     "use_scripts": false,
 *     "columns": { "repo_name": "repository", "commit_sha": "revision", "script": "script" }
 *   }
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace envbox {
namespace core {

using json = nlohmann::json;

/**
 * @struct SessionConfig
 * @brief Settings of one interactive SandboxSession
 */
struct SessionConfig {
    std::string image;                                   ///< Container image
    std::map<std::string, std::string> env_vars;         ///< Extra container environment
    bool repository_workdir{true};                       ///< Start commands in the mounted repo
    std::chrono::seconds container_start_timeout{300};   ///< Bound on create + start
    std::optional<std::chrono::seconds> bash_timeout{std::chrono::seconds(120)};  ///< Per-command limit
    std::optional<std::size_t> max_num_chars_bash_output{16000};  ///< Output limit in characters
    bool read_only{false};                               ///< Reject write commands, mount `:ro`
    std::optional<std::string> timeout_message;          ///< Overrides the default timeout text
    std::vector<std::string> initial_commands;           ///< Must all exit 0 at session start
    std::string mount_path{"/data/project"};             ///< Repository location in the container

    /**
     * @brief Parse from JSON, keeping defaults for absent keys
     *
     * `bash_timeout` and `max_num_chars_bash_output` accept `null` to
     * disable the limit.
     *
     * @throws nlohmann::json::exception on type mismatches
     */
    static SessionConfig FromJson(const json& j);

    json ToJson() const;
};

/**
 * @struct EvaluationConfig
 * @brief Settings of a batch evaluation run
 */
struct EvaluationConfig {
    std::string language{"python"};                     ///< Default language of jobs

    // Docker
    std::chrono::seconds create_container_timeout{180};  ///< Bound on pull + create
    std::chrono::seconds container_timeout{600};         ///< Bound on wait + logs
    std::map<std::string, std::string> images{
        {"python", "ghcr.io/jetbrains-research/envbench-python"},
        {"jvm", "ghcr.io/jetbrains-research/envbench-jvm"},
        {"repo2run", "ghcr.io/jetbrains-research/envbench-python"}
    };                                                   ///< Image per language

    // Operation
    std::filesystem::path repo_data_dir{"./tmp/repo_data"};        ///< Checkouts
    std::filesystem::path json_results_dir{"./tmp/results/json"};  ///< Per-job records
    std::filesystem::path repo_archives_dir{"./tmp/archives"};     ///< Source archives
    std::size_t max_workers{4};                          ///< Concurrently running jobs
    bool rewrite_results{false};                         ///< Purge prior records first

    // Input
    bool use_scripts{false};                             ///< Read bootstrap scripts from input
    std::string repo_name_column{"repository"};          ///< Column holding "owner/name"
    std::string commit_sha_column{"revision"};           ///< Column holding the revision
    std::string script_column{"script"};                 ///< Column holding the bootstrap script

    /**
     * @brief Image configured for a language
     * @return Image name, or nullopt if none is configured
     */
    std::optional<std::string> ImageFor(const std::string& language) const;

    /**
     * @throws nlohmann::json::exception on type mismatches
     */
    static EvaluationConfig FromJson(const json& j);

    /**
     * @brief Load from a JSON file
     * @throws std::runtime_error if the file cannot be opened
     * @throws nlohmann::json::exception on malformed JSON
     */
    static EvaluationConfig LoadFromFile(const std::filesystem::path& path);

    json ToJson() const;
};

} // namespace core
} // namespace envbox
