/**
 * @file config.cpp
 * @brief JSON loading of evaluation and session configuration
 *
 * @date 2025
 */

#include "envbox/core/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace envbox {
namespace core {

namespace {

const json& Section(const json& j, const char* key) {
    static const json empty = json::object();
    if (j.is_object() && j.contains(key) && j.at(key).is_object()) {
        return j.at(key);
    }
    return empty;
}

template <typename T>
std::optional<T> NullableValue(const json& j, const char* key, std::optional<T> fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

} // anonymous namespace

// ============================================================================
// SESSION CONFIG
// ============================================================================

SessionConfig SessionConfig::FromJson(const json& j) {
    SessionConfig config;
    if (!j.is_object()) {
        return config;
    }

    config.image = j.value("image", config.image);
    config.env_vars = j.value("env_vars", config.env_vars);
    config.repository_workdir = j.value("repository_workdir", config.repository_workdir);
    config.container_start_timeout = std::chrono::seconds(
        j.value("container_start_timeout", config.container_start_timeout.count()));

    auto bash_timeout = NullableValue<long long>(j, "bash_timeout", config.bash_timeout->count());
    config.bash_timeout = bash_timeout ? std::optional<std::chrono::seconds>(*bash_timeout)
                                       : std::nullopt;
    config.max_num_chars_bash_output = NullableValue<std::size_t>(
        j, "max_num_chars_bash_output", config.max_num_chars_bash_output);

    config.read_only = j.value("read_only", config.read_only);
    config.timeout_message = NullableValue<std::string>(j, "timeout_message", std::nullopt);
    config.initial_commands = j.value("initial_commands", config.initial_commands);
    config.mount_path = j.value("mount_path", config.mount_path);
    return config;
}

json SessionConfig::ToJson() const {
    json j;
    j["image"] = image;
    j["env_vars"] = env_vars;
    j["repository_workdir"] = repository_workdir;
    j["container_start_timeout"] = container_start_timeout.count();
    j["bash_timeout"] = bash_timeout ? json(bash_timeout->count()) : json(nullptr);
    j["max_num_chars_bash_output"] = max_num_chars_bash_output
        ? json(*max_num_chars_bash_output) : json(nullptr);
    j["read_only"] = read_only;
    j["timeout_message"] = timeout_message ? json(*timeout_message) : json(nullptr);
    j["initial_commands"] = initial_commands;
    j["mount_path"] = mount_path;
    return j;
}

// ============================================================================
// EVALUATION CONFIG
// ============================================================================

std::optional<std::string> EvaluationConfig::ImageFor(const std::string& language) const {
    auto it = images.find(language);
    if (it == images.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

EvaluationConfig EvaluationConfig::FromJson(const json& j) {
    EvaluationConfig config;
    if (!j.is_object()) {
        return config;
    }

    config.language = j.value("language", config.language);

    const json& docker = Section(j, "docker");
    config.create_container_timeout = std::chrono::seconds(
        docker.value("create_container_timeout", config.create_container_timeout.count()));
    config.container_timeout = std::chrono::seconds(
        docker.value("container_timeout", config.container_timeout.count()));
    for (const auto& [language, image] : Section(docker, "image").items()) {
        config.images[language] = image.get<std::string>();
    }

    const json& operation = Section(j, "operation");
    const json& dirs = Section(operation, "dirs");
    config.repo_data_dir = dirs.value("repo_data", config.repo_data_dir.string());
    config.json_results_dir = dirs.value("json_results", config.json_results_dir.string());
    config.repo_archives_dir = dirs.value("repo_archives", config.repo_archives_dir.string());
    config.max_workers = Section(operation, "pool_config").value("max_workers", config.max_workers);
    config.rewrite_results = operation.value("rewrite_results", config.rewrite_results);

    const json& input = Section(j, "input");
    config.use_scripts = input.value("use_scripts", config.use_scripts);
    const json& columns = Section(input, "columns");
    config.repo_name_column = columns.value("repo_name", config.repo_name_column);
    config.commit_sha_column = columns.value("commit_sha", config.commit_sha_column);
    config.script_column = columns.value("script", config.script_column);

    if (config.max_workers == 0) {
        spdlog::warn("max_workers is 0; using 1");
        config.max_workers = 1;
    }
    return config;
}

EvaluationConfig EvaluationConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    json j;
    file >> j;
    spdlog::debug("Loaded evaluation config from {}", path.string());
    return FromJson(j);
}

json EvaluationConfig::ToJson() const {
    json j;
    j["language"] = language;
    j["docker"]["create_container_timeout"] = create_container_timeout.count();
    j["docker"]["container_timeout"] = container_timeout.count();
    j["docker"]["image"] = images;
    j["operation"]["dirs"]["repo_data"] = repo_data_dir.string();
    j["operation"]["dirs"]["json_results"] = json_results_dir.string();
    j["operation"]["dirs"]["repo_archives"] = repo_archives_dir.string();
    j["operation"]["pool_config"]["max_workers"] = max_workers;
    j["operation"]["rewrite_results"] = rewrite_results;
    j["input"]["use_scripts"] = use_scripts;
    j["input"]["columns"]["repo_name"] = repo_name_column;
    j["input"]["columns"]["commit_sha"] = commit_sha_column;
    j["input"]["columns"]["script"] = script_column;
    return j;
}

} // namespace core
} // namespace envbox
