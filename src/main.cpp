/**
 * @file main.cpp
 * @brief envbox - Command-line interface
 *
 * Entry point for the envbox sandbox engine. Provides two subcommands:
 *
 * - `evaluate`: batch-run build scripts for a JSONL list of repository
 *   revisions, one container per job, and write one JSON record per job
 * - `shell`: an interactive, state-preserving shell session over a
 *   container with a repository checkout mounted
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "envbox/core/batch_job_runner.hpp"
#include "envbox/core/concurrency_scheduler.hpp"
#include "envbox/core/config.hpp"
#include "envbox/core/exit_codes.hpp"
#include "envbox/core/repo_workspace.hpp"
#include "envbox/core/result_store.hpp"
#include "envbox/core/sandbox_session.hpp"
#include "envbox/utils/container_utils.hpp"
#include "envbox/utils/string_utils.hpp"

#include <iostream>
#include <fstream>
#include <iomanip>
#include <map>

using json = nlohmann::json;
using namespace envbox;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║   envbox - sandboxed shell execution for build evaluation     ║
║                            v1.0.0                             ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void PrintEvaluationSummary(const std::map<core::JobKey, core::BuildResult>& results,
                            std::size_t skipped) {
    std::map<std::string, std::size_t> by_outcome;
    long long total_issues = 0;
    for (const auto& [key, result] : results) {
        int code = result.exit_code.value_or(core::exit_codes::UNKNOWN_FAILURE);
        by_outcome[core::exit_codes::Describe(code)]++;
        total_issues += result.issues_count;
    }

    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                     EVALUATION SUMMARY                        ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════════╝\n";
    std::cout << "  Jobs run:      " << results.size() << "\n";
    std::cout << "  Jobs skipped:  " << skipped << " (existing results)\n";
    for (const auto& [outcome, count] : by_outcome) {
        std::cout << "  " << std::left << std::setw(15) << (outcome + ":") << count << "\n";
    }
    std::cout << "  Total issues:  " << total_issues << "\n";
}

/*******************************************************************************
 * Input Loading
 ******************************************************************************/

std::vector<core::JobSpec> LoadJobs(const std::string& input_path,
                                    const core::EvaluationConfig& config) {
    std::ifstream input(input_path);
    if (!input) {
        throw std::runtime_error("Cannot open input file: " + input_path);
    }

    std::vector<core::JobSpec> jobs;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (utils::StringUtils::Trim(line).empty()) {
            continue;
        }

        json row;
        try {
            row = json::parse(line);
        } catch (const json::parse_error& e) {
            spdlog::warn("[WARN] Skipping line {}: {}", line_number, e.what());
            continue;
        }

        if (!row.is_object() ||
            !row.contains(config.repo_name_column) || !row[config.repo_name_column].is_string() ||
            !row.contains(config.commit_sha_column) || !row[config.commit_sha_column].is_string()) {
            spdlog::warn("[WARN] Skipping line {}: missing '{}' or '{}'", line_number,
                         config.repo_name_column, config.commit_sha_column);
            continue;
        }

        core::JobSpec job;
        job.repository = row[config.repo_name_column].get<std::string>();
        job.commit_sha = row[config.commit_sha_column].get<std::string>();
        job.language = row.value("language", config.language);
        if (config.use_scripts && row.contains(config.script_column) &&
            row[config.script_column].is_string()) {
            job.bootstrap_script = row[config.script_column].get<std::string>();
        }
        jobs.push_back(std::move(job));
    }

    return jobs;
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunEvaluate(core::EvaluationConfig config,
                const std::string& input_path,
                const std::string& docker_binary) {
    spdlog::info("[INIT] Checking container runtime...");
    if (!utils::ContainerUtils::IsRuntimeAvailable(docker_binary)) {
        spdlog::error("[ERROR] '{}' is not available or the daemon is not running", docker_binary);
        return 1;
    }
    spdlog::info("[INIT] {}", utils::ContainerUtils::GetRuntimeVersion(docker_binary));

    auto jobs = LoadJobs(input_path, config);
    spdlog::info("[INIT] Loaded {} jobs from {}", jobs.size(), input_path);

    core::ResultStore store(config.json_results_dir);
    auto pending = store.FilterPending(jobs, config.rewrite_results);

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[START] {} jobs, {} workers, language {}",
                 pending.size(), config.max_workers, config.language);

    utils::ContainerUtils docker(docker_binary);
    core::ArchiveRepoWorkspace workspace(config.repo_archives_dir, config.repo_data_dir);
    core::BatchJobRunner runner(docker, workspace, config);
    core::ConcurrencyScheduler scheduler(config.max_workers);

    auto results = scheduler.RunJobs(
        pending,
        [&runner](const core::JobSpec& job) { return runner.Run(job); },
        [&store](const core::BuildResult& result) {
            if (store.Save(result).empty()) {
                spdlog::warn("[WARN] Result for {}@{} was not saved",
                             result.repo_name, result.commit_sha);
            }
        });

    store.WriteAggregate();

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[DONE] Evaluation complete!");

    PrintEvaluationSummary(results, jobs.size() - pending.size());
    return 0;
}

int RunShell(const core::SessionConfig& config,
             const std::string& repo_path,
             const std::string& docker_binary,
             const std::string& history_path) {
    utils::ContainerUtils docker(docker_binary);

    spdlog::info("[INIT] Starting session on {}", repo_path);
    auto session = core::SandboxSession::Create(docker, config, repo_path);
    spdlog::info("[READY] Type commands; end a line with '\\' to continue it, Ctrl-D to quit");

    std::string line;
    std::string command;
    while (true) {
        std::cerr << (command.empty() ? "envbox$ " : "> ") << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        if (!line.empty() && line.back() == '\\') {
            command += line.substr(0, line.size() - 1) + "\n";
            continue;
        }
        command += line;
        if (utils::StringUtils::Trim(command).empty()) {
            command.clear();
            continue;
        }

        auto result = session->ExecuteBashCommand(command);
        std::cout << result.output << std::endl;
        std::cerr << "[exit: " << (result.exit_code ? std::to_string(*result.exit_code) : "none")
                  << "]" << std::endl;
        command.clear();
    }

    if (!history_path.empty()) {
        json history = json::array();
        for (const auto& entry : session->CommandsHistory()) {
            history.push_back(entry.ToJson());
        }
        std::ofstream file(history_path);
        if (!file) {
            spdlog::warn("[WARN] Cannot write history to {}", history_path);
        } else {
            file << history.dump(2) << std::endl;
            spdlog::info("[REPORT] History saved: {}", history_path);
        }
    }

    session->Clean();
    return 0;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"envbox - sandboxed execution of LLM-generated shell commands"};
    app.require_subcommand(1);

    bool verbose = false;
    std::string docker_binary = "docker";
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--docker", docker_binary, "Docker-compatible CLI binary")
        ->default_val("docker");

    // evaluate
    auto* evaluate = app.add_subcommand("evaluate", "Run build scripts for a batch of repositories");
    std::string input_path;
    std::string config_path;
    std::string language;
    std::size_t max_workers = 0;
    std::string archives_dir;
    std::string repo_data_dir;
    std::string results_dir;
    bool rewrite_results = false;
    bool use_scripts = false;

    evaluate->add_option("-i,--input", input_path, "JSONL file with one job per line")
        ->required()
        ->check(CLI::ExistingFile);
    evaluate->add_option("-c,--config", config_path, "Evaluation config (JSON)")
        ->check(CLI::ExistingFile);
    auto* language_opt = evaluate->add_option("-l,--language", language, "python, jvm or repo2run");
    auto* workers_opt = evaluate->add_option("-w,--max-workers", max_workers, "Concurrent jobs")
        ->check(CLI::PositiveNumber);
    auto* archives_opt = evaluate->add_option("--archives", archives_dir, "Directory of repository archives");
    auto* repo_data_opt = evaluate->add_option("--repo-data", repo_data_dir, "Directory for checkouts");
    auto* results_opt = evaluate->add_option("--results", results_dir, "Directory for per-job JSON results");
    evaluate->add_flag("--rewrite-results", rewrite_results, "Purge existing results first");
    evaluate->add_flag("--use-scripts", use_scripts, "Read bootstrap scripts from the input");

    // shell
    auto* shell = app.add_subcommand("shell", "Interactive sandboxed shell over a repository");
    std::string repo_path;
    std::string session_config_path;
    std::string image;
    bool read_only = false;
    int bash_timeout = 120;
    int max_chars = 16000;
    std::vector<std::string> init_commands;
    std::string history_path;

    shell->add_option("-r,--repo", repo_path, "Repository checkout to mount")
        ->required()
        ->check(CLI::ExistingDirectory);
    shell->add_option("-c,--config", session_config_path, "Session config (JSON)")
        ->check(CLI::ExistingFile);
    auto* image_opt = shell->add_option("--image", image, "Container image");
    auto* read_only_opt = shell->add_flag("--read-only", read_only, "Reject write commands, mount read-only");
    auto* timeout_opt = shell->add_option("--bash-timeout", bash_timeout, "Per-command timeout in seconds (0 = none)")
        ->check(CLI::NonNegativeNumber);
    auto* chars_opt = shell->add_option("--max-chars", max_chars, "Output limit in characters (0 = none)")
        ->check(CLI::NonNegativeNumber);
    shell->add_option("--init", init_commands, "Command that must succeed at session start");
    shell->add_option("--history", history_path, "Write the command history (JSON) on exit");

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    PrintBanner();

    try {
        if (evaluate->parsed()) {
            core::EvaluationConfig config = config_path.empty()
                ? core::EvaluationConfig{}
                : core::EvaluationConfig::LoadFromFile(config_path);

            if (language_opt->count() > 0) config.language = language;
            if (workers_opt->count() > 0) config.max_workers = max_workers;
            if (archives_opt->count() > 0) config.repo_archives_dir = archives_dir;
            if (repo_data_opt->count() > 0) config.repo_data_dir = repo_data_dir;
            if (results_opt->count() > 0) config.json_results_dir = results_dir;
            if (rewrite_results) config.rewrite_results = true;
            if (use_scripts) config.use_scripts = true;

            return RunEvaluate(config, input_path, docker_binary);
        }

        core::SessionConfig config;
        if (!session_config_path.empty()) {
            std::ifstream file(session_config_path);
            json j;
            file >> j;
            config = core::SessionConfig::FromJson(j);
        }

        if (image_opt->count() > 0) config.image = image;
        if (read_only_opt->count() > 0) config.read_only = read_only;
        if (timeout_opt->count() > 0) {
            config.bash_timeout = bash_timeout > 0
                ? std::optional<std::chrono::seconds>(bash_timeout) : std::nullopt;
        }
        if (chars_opt->count() > 0) {
            config.max_num_chars_bash_output = max_chars > 0
                ? std::optional<std::size_t>(static_cast<std::size_t>(max_chars)) : std::nullopt;
        }
        config.initial_commands.insert(config.initial_commands.end(),
                                       init_commands.begin(), init_commands.end());

        if (config.image.empty()) {
            spdlog::error("[ERROR] No image given (--image or \"image\" in the config)");
            return 1;
        }

        return RunShell(config, repo_path, docker_binary, history_path);

    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const json::exception& e) {
        spdlog::error("[ERROR] Invalid JSON: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
