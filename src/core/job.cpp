/**
 * @file job.cpp
 * @brief Implementation of job identity and build result serialization
 *
 * @date 2025
 */

#include "envbox/core/job.hpp"
#include "envbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <tuple>

namespace envbox {
namespace core {

std::string LanguageToString(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::JVM: return "jvm";
        case Language::REPO2RUN: return "repo2run";
    }
    return "unknown";
}

std::optional<Language> ParseLanguage(const std::string& name) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));
    if (lower == "python") return Language::PYTHON;
    if (lower == "jvm") return Language::JVM;
    if (lower == "repo2run") return Language::REPO2RUN;
    return std::nullopt;
}

// ============================================================================
// JOB KEY
// ============================================================================

std::string JobKey::FileStem() const {
    return utils::StringUtils::ReplaceAll(repository, "/", "__") + "@" + revision;
}

std::optional<JobKey> JobKey::FromFileStem(const std::string& stem) {
    auto at = stem.rfind('@');
    if (at == std::string::npos || at == 0) {
        return std::nullopt;
    }
    JobKey key;
    key.repository = utils::StringUtils::ReplaceAll(stem.substr(0, at), "__", "/");
    key.revision = stem.substr(at + 1);
    return key;
}

bool JobKey::operator<(const JobKey& other) const {
    return std::tie(repository, revision) < std::tie(other.repository, other.revision);
}

bool JobKey::operator==(const JobKey& other) const {
    return repository == other.repository && revision == other.revision;
}

// ============================================================================
// BUILD RESULT
// ============================================================================

void BuildResult::MergeFields(const json& fields) {
    if (!fields.is_object()) {
        spdlog::warn("Result file for {} is not a JSON object; ignoring", repo_name);
        return;
    }

    for (const auto& [key, value] : fields.items()) {
        if (key == "exit_code" && value.is_number_integer()) {
            exit_code = value.get<int>();
        } else if (key == "issues_count" && value.is_number()) {
            issues_count = value.get<long long>();
        } else if (key == "execution_time" && value.is_number()) {
            execution_time = value.get<double>();
        } else if (key == "container_logs" && (value.is_string() || value.is_null())) {
            container_logs = value.is_null() ? std::nullopt
                                             : std::optional<std::string>(value.get<std::string>());
        } else if (key == "repo_name" && value.is_string()) {
            repo_name = value.get<std::string>();
        } else if (key == "commit_sha" && value.is_string()) {
            commit_sha = value.get<std::string>();
        } else if (key == "script_sha256" && value.is_string()) {
            script_sha256 = value.get<std::string>();
        } else {
            extra[key] = value;
        }
    }
}

void BuildResult::MergeResultFile(const json& fields) {
    static const char* const kRunnerFields[] = {
        "exit_code", "execution_time", "repo_name",
        "commit_sha", "container_logs", "script_sha256"
    };

    if (!fields.is_object()) {
        spdlog::warn("Result file for {} is not a JSON object; ignoring", repo_name);
        return;
    }

    json filtered = fields;
    for (const char* name : kRunnerFields) {
        if (filtered.erase(std::string(name)) > 0) {
            spdlog::debug("Result file for {} sets reserved field {}; ignored", repo_name, name);
        }
    }
    MergeFields(filtered);
}

json BuildResult::ToJson() const {
    json j = extra.is_object() ? extra : json::object();
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    j["execution_time"] = execution_time;
    j["repo_name"] = repo_name;
    j["commit_sha"] = commit_sha;
    j["container_logs"] = container_logs ? json(*container_logs) : json(nullptr);
    j["issues_count"] = issues_count;
    j["script_sha256"] = script_sha256;
    return j;
}

BuildResult BuildResult::FromJson(const json& j) {
    BuildResult result;
    result.repo_name = j.at("repo_name").get<std::string>();
    result.commit_sha = j.value("commit_sha", "");
    result.MergeFields(j);
    return result;
}

} // namespace core
} // namespace envbox
