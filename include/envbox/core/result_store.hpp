/**
 * @file result_store.hpp
 * @brief Per-job JSON result records and batch resume
 *
 * @date 2025
 */

#pragma once

#include "envbox/core/job.hpp"

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <filesystem>

namespace envbox {
namespace core {

/**
 * @class ResultStore
 * @brief Directory of one JSON file per (repository, revision)
 *
 * **Layout**:
 * ```
 * results_dir/
 *   owner__name@sha.json   ← one BuildResult::ToJson() per job
 *   ...
 * results.jsonl            ← WriteAggregate(), next to results_dir
 * ```
 *
 * Files are written to a temporary name and renamed, so a record is either
 * complete or absent. Distinct jobs never share a file, so concurrent Save()
 * calls need no locking.
 */
class ResultStore {
public:
    explicit ResultStore(std::filesystem::path results_dir);

    /**
     * @brief Write the record of one job
     * @return Path written, or empty path on failure (logged)
     */
    std::filesystem::path Save(const BuildResult& result) const;

    /**
     * @brief Read a saved record
     * @return Record, or nullopt if absent or malformed
     */
    std::optional<BuildResult> Load(const JobKey& key) const;

    bool Exists(const JobKey& key) const;

    /**
     * @brief Keys of all readable records
     *
     * Keys come from each file's `repo_name`/`commit_sha`; malformed files
     * are logged and skipped.
     */
    std::set<JobKey> CompletedKeys() const;

    /**
     * @brief Delete every record
     */
    void Purge() const;

    /**
     * @brief Jobs that still need to run
     *
     * With @p rewrite all records are purged and every job is pending.
     */
    std::vector<JobSpec> FilterPending(const std::vector<JobSpec>& jobs, bool rewrite) const;

    /**
     * @brief Write every record, one JSON object per line
     * @param output_path Destination (default: `results.jsonl` next to the directory)
     * @return Number of records written
     */
    std::size_t WriteAggregate(std::optional<std::filesystem::path> output_path = std::nullopt) const;

    std::filesystem::path PathFor(const JobKey& key) const;
    const std::filesystem::path& Directory() const { return results_dir_; }

private:
    std::vector<std::filesystem::path> RecordFiles() const;

    std::filesystem::path results_dir_;  ///< Record directory
};

} // namespace core
} // namespace envbox
