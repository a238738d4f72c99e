/**
 * @file result_store.cpp
 * @brief Implementation of the per-job result directory
 *
 * @date 2025
 */

#include "envbox/core/result_store.hpp"
#include "envbox/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace envbox {
namespace core {

namespace fs = std::filesystem;

namespace {

std::optional<json> ReadJsonFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    try {
        json j;
        file >> j;
        return j;
    } catch (const json::exception& e) {
        spdlog::warn("Malformed result file {}: {}", path.filename().string(), e.what());
        return std::nullopt;
    }
}

} // anonymous namespace

ResultStore::ResultStore(fs::path results_dir)
    : results_dir_(std::move(results_dir)) {
}

fs::path ResultStore::PathFor(const JobKey& key) const {
    return results_dir_ / (key.FileStem() + ".json");
}

fs::path ResultStore::Save(const BuildResult& result) const {
    const fs::path output_path = PathFor(result.Key());
    const fs::path temp_path = output_path.string() + ".tmp-" + utils::HashUtils::RandomToken(8);

    try {
        fs::create_directories(results_dir_);

        {
            std::ofstream file(temp_path);
            if (!file) {
                spdlog::error("Failed to open file for writing: {}", temp_path.string());
                return {};
            }
            file << result.ToJson().dump(2);
            if (!file) {
                spdlog::error("Failed to write result record: {}", temp_path.string());
                return {};
            }
        }

        fs::rename(temp_path, output_path);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save result for {}: {}", result.Key().FileStem(), e.what());
        std::error_code ec;
        fs::remove(temp_path, ec);
        return {};
    }

    spdlog::debug("Result saved: {}", output_path.string());
    return output_path;
}

std::optional<BuildResult> ResultStore::Load(const JobKey& key) const {
    auto j = ReadJsonFile(PathFor(key));
    if (!j) {
        return std::nullopt;
    }
    try {
        return BuildResult::FromJson(*j);
    } catch (const json::exception& e) {
        spdlog::warn("Unreadable result record {}: {}", key.FileStem(), e.what());
        return std::nullopt;
    }
}

bool ResultStore::Exists(const JobKey& key) const {
    std::error_code ec;
    return fs::is_regular_file(PathFor(key), ec);
}

std::vector<fs::path> ResultStore::RecordFiles() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(results_dir_, ec)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(results_dir_)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::set<JobKey> ResultStore::CompletedKeys() const {
    std::set<JobKey> keys;
    for (const auto& path : RecordFiles()) {
        auto j = ReadJsonFile(path);
        if (!j) {
            continue;
        }
        if (!j->is_object() || !j->contains("repo_name") || !(*j)["repo_name"].is_string() ||
            !j->contains("commit_sha") || !(*j)["commit_sha"].is_string()) {
            spdlog::warn("Result file {} lacks repo_name/commit_sha", path.filename().string());
            continue;
        }
        keys.insert(JobKey{(*j)["repo_name"].get<std::string>(), (*j)["commit_sha"].get<std::string>()});
    }
    return keys;
}

void ResultStore::Purge() const {
    std::size_t removed = 0;
    for (const auto& path : RecordFiles()) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            ++removed;
        } else if (ec) {
            spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
        }
    }
    spdlog::info("Purged {} previous results from {}", removed, results_dir_.string());
}

std::vector<JobSpec> ResultStore::FilterPending(const std::vector<JobSpec>& jobs, bool rewrite) const {
    if (rewrite) {
        Purge();
        return jobs;
    }

    const auto completed = CompletedKeys();
    std::vector<JobSpec> pending;
    for (const auto& job : jobs) {
        if (completed.count(job.Key()) == 0) {
            pending.push_back(job);
        }
    }

    if (pending.size() < jobs.size()) {
        spdlog::info("Skipping {} jobs with existing results", jobs.size() - pending.size());
    }
    return pending;
}

std::size_t ResultStore::WriteAggregate(std::optional<fs::path> output_path) const {
    fs::path target = output_path ? *output_path
                                  : results_dir_.parent_path() / "results.jsonl";
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }

    std::ofstream file(target);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", target.string());
        return 0;
    }

    std::size_t written = 0;
    for (const auto& path : RecordFiles()) {
        auto j = ReadJsonFile(path);
        if (!j) {
            continue;
        }
        file << j->dump() << '\n';
        ++written;
    }

    spdlog::info("Aggregated {} results into {}", written, target.string());
    return written;
}

} // namespace core
} // namespace envbox
