/**
 * @file job.hpp
 * @brief Job identity, job specification and build result records
 *
 * A job is one (repository, revision) pair evaluated once in a fresh
 * container. The BuildResult is the JSON record emitted for it.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>

#include <nlohmann/json.hpp>

namespace envbox {
namespace core {

using json = nlohmann::json;

/**
 * @enum Language
 * @brief Build toolchain selecting the build script and image
 */
enum class Language {
    PYTHON,     ///< pyright type check
    JVM,        ///< Maven/Gradle compile
    REPO2RUN    ///< pytest collection
};

/**
 * @brief Lowercase language name ("python", "jvm", "repo2run")
 */
std::string LanguageToString(Language language);

/**
 * @brief Parse a language name
 * @return Language, or nullopt for unsupported names
 */
std::optional<Language> ParseLanguage(const std::string& name);

/**
 * @struct JobKey
 * @brief Idempotency key of a job
 *
 * Rendered on disk as `owner__name@revision`.
 */
struct JobKey {
    std::string repository;   ///< "owner/name"
    std::string revision;     ///< Commit SHA

    /**
     * @brief File-name stem: '/' in the repository becomes "__"
     */
    std::string FileStem() const;

    /**
     * @brief Inverse of FileStem()
     * @return Key, or nullopt if the stem has no '@'
     */
    static std::optional<JobKey> FromFileStem(const std::string& stem);

    bool operator<(const JobKey& other) const;
    bool operator==(const JobKey& other) const;
};

/**
 * @struct JobSpec
 * @brief Input of one batch job
 */
struct JobSpec {
    std::string repository;                       ///< "owner/name"
    std::string commit_sha;                       ///< Revision to check out
    std::string language;                         ///< "python", "jvm" or "repo2run"
    std::optional<std::string> bootstrap_script;  ///< Pre-generated setup script

    JobKey Key() const { return JobKey{repository, commit_sha}; }
};

/**
 * @struct BuildResult
 * @brief Structured outcome of one job
 *
 * `extra` holds every field merged from the in-container result file that
 * is not one of the named members; ToJson() flattens it into the top level.
 */
struct BuildResult {
    std::optional<int> exit_code;                 ///< Script status or sentinel; unset until decided
    double execution_time{0.0};                   ///< Wall-clock seconds
    std::string repo_name;                        ///< Repository
    std::string commit_sha;                       ///< Revision
    std::optional<std::string> container_logs;    ///< Logs or failure description
    long long issues_count{0};                    ///< Issues reported by the build
    std::string script_sha256;                    ///< SHA-256 of the bootstrap script
    json extra = json::object();                  ///< Merged result-file fields

    JobKey Key() const { return JobKey{repo_name, commit_sha}; }

    /**
     * @brief Merge top-level fields of a result file
     *
     * Named members (exit_code, issues_count, ...) are updated when present
     * with a compatible type; all other keys go to `extra`.
     */
    void MergeFields(const json& fields);

    /**
     * @brief Merge an in-container result file
     *
     * Like MergeFields(), except that the fields the runner owns
     * (exit_code, execution_time, repo_name, commit_sha, container_logs,
     * script_sha256) are never overwritten by the build.
     */
    void MergeResultFile(const json& fields);

    json ToJson() const;

    /**
     * @throws nlohmann::json::exception on malformed records
     */
    static BuildResult FromJson(const json& j);
};

} // namespace core
} // namespace envbox
