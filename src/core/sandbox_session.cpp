/**
 * @file sandbox_session.cpp
 * @brief Implementation of the interactive sandbox session
 *
 * Each command is wrapped by SessionState::BuildScript() and executed as a
 * separate `docker exec`. The wrapper's EXIT trap prints the new shell state
 * behind a per-call marker; SessionState::SplitOutput() strips it off again
 * before the output is formatted.
 *
 * A timed-out exec leaves the container in an unknown state (the hung
 * process may still be running), so the container is replaced. The state
 * captured after the last completed command is replayed into the new one.
 *
 * @date 2025
 */

#include "envbox/core/sandbox_session.hpp"
#include "envbox/utils/hash_utils.hpp"
#include "envbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace envbox {
namespace core {

using utils::StringUtils;

namespace {

std::string FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // anonymous namespace

json CommandExecutionResult::ToJson() const {
    json j;
    j["command"] = command;
    j["output"] = output;
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    j["timestamp"] = FormatTimestamp(timestamp);
    return j;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

SandboxSession::SandboxSession(utils::ContainerClient& client,
                               SessionConfig config,
                               const std::filesystem::path& repo_path)
    : config_(std::move(config))
    , formatter_(config_.max_num_chars_bash_output) {

    utils::ContainerBuilder builder;
    builder.WithName("envbox-session-" + utils::HashUtils::RandomToken(12))
           .WithImage(config_.image)
           .WithCommand({"tail", "-f", "/dev/null"})
           .WithMount(std::filesystem::absolute(repo_path), config_.mount_path, config_.read_only)
           .WithLabel("envbox.role", "session");

    if (config_.repository_workdir) {
        builder.WithWorkingDir(config_.mount_path);
    }
    for (const auto& [key, value] : config_.env_vars) {
        builder.WithEnvironment(key, value);
    }

    handle_ = std::make_unique<ContainerHandle>(client, builder.Build());
}

SandboxSession::~SandboxSession() {
    Clean();
}

std::unique_ptr<SandboxSession> SandboxSession::Create(utils::ContainerClient& client,
                                                       const SessionConfig& config,
                                                       const std::filesystem::path& repo_path) {
    if (config.image.empty()) {
        throw std::invalid_argument("Session image must not be empty");
    }

    std::unique_ptr<SandboxSession> session(new SandboxSession(client, config, repo_path));
    session->Start();

    for (const auto& command : session->config_.initial_commands) {
        auto result = session->ExecuteBashCommand(command);
        if (!result.exit_code || *result.exit_code != 0) {
            throw std::runtime_error("Couldn't execute initial command " + command +
                                     ". Output: " + result.output);
        }
    }

    return session;
}

void SandboxSession::Start() {
    spdlog::info("Starting session container from {}", config_.image);
    spdlog::debug("Repository mounted at {}{}", config_.mount_path,
                  config_.read_only ? " (read-only)" : "");

    handle_->Create(config_.container_start_timeout);
    handle_->Start();

    spdlog::info("✓ Session container running: {}", handle_->Id().substr(0, 12));
}

// ============================================================================
// EXECUTION
// ============================================================================

std::string SandboxSession::DefaultTimeoutMessage(std::chrono::seconds timeout) {
    return "ERROR: Command timed out after " + std::to_string(timeout.count()) +
           " seconds. The container was restarted; exported variables and the "
           "working directory were kept, background processes were lost.";
}

std::optional<std::chrono::milliseconds> SandboxSession::BashTimeout() const {
    if (!config_.bash_timeout) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*config_.bash_timeout);
}

BashCommandOutput SandboxSession::ExecuteBashCommand(const std::string& command, bool add_to_history) {
    if (IsClean()) {
        throw std::logic_error("Session used after Clean()");
    }

    if (config_.read_only) {
        if (auto reason = policy_.Check(command)) {
            spdlog::info("Rejected write command ({}): {}", *reason,
                         StringUtils::Truncate(command, 80));
            return BashCommandOutput{kReadOnlyRejection, std::nullopt};
        }
    }

    std::lock_guard<std::mutex> command_lock(command_mutex_);

    // Clean() may have run while this call waited for the lock
    if (IsClean()) {
        throw std::logic_error("Session used after Clean()");
    }

    CommandExecutionResult entry;
    entry.command = command;
    entry.timestamp = std::chrono::system_clock::now();

    if (!handle_->IsRunning() && !RecoverContainer()) {
        entry.output = "ERROR: Session container is unavailable and could not be restarted.";
        if (add_to_history) {
            Record(entry);
        }
        return BashCommandOutput{entry.output, std::nullopt};
    }

    SessionState state = State();
    const std::string marker = SessionState::NewMarker();
    const std::string script = state.BuildScript(command, marker);

    spdlog::debug("Executing: {}", StringUtils::Truncate(command, 200));

    utils::ContainerExecResult exec_result;
    try {
        exec_result = handle_->Exec(script, BashTimeout());
    } catch (const utils::ContainerError& e) {
        spdlog::error("Exec failed in container {}: {}", handle_->Id().substr(0, 12), e.what());
        RecoverContainer();
        entry.output = std::string("ERROR: Container failure: ") + e.what();
        if (add_to_history) {
            Record(entry);
        }
        return BashCommandOutput{entry.output, std::nullopt};
    }

    if (exec_result.timed_out) {
        spdlog::warn("Command timed out after {}s: {}",
                     config_.bash_timeout ? config_.bash_timeout->count() : 0,
                     StringUtils::Truncate(command, 80));
        RecoverContainer();

        entry.output = config_.timeout_message
            ? *config_.timeout_message
            : DefaultTimeoutMessage(config_.bash_timeout.value_or(std::chrono::seconds(0)));
        if (add_to_history) {
            Record(entry);
        }
        return BashCommandOutput{entry.output, std::nullopt};
    }

    SplitResult split = SessionState::SplitOutput(exec_result.output, marker);
    std::optional<int> exit_code = exec_result.exit_code;

    {
        std::lock_guard<std::mutex> data_lock(data_mutex_);
        if (split.snapshot) {
            state_.Apply(*split.snapshot);
            exit_code = split.snapshot->exit_code;
        } else {
            spdlog::debug("No state snapshot captured; keeping previous state");
            state_.SetLastExitCode(exit_code);
        }
    }

    entry.exit_code = exit_code;
    entry.output = formatter_.Format(StringUtils::TrimTrailingNewlines(split.output), exit_code);

    spdlog::debug("Exit code: {} ({} ms)",
                  exit_code ? std::to_string(*exit_code) : std::string("none"),
                  exec_result.duration.count());

    if (add_to_history) {
        Record(entry);
    }
    return BashCommandOutput{entry.output, entry.exit_code};
}

bool SandboxSession::RecoverContainer() {
    try {
        handle_->Restart(config_.container_start_timeout);
        spdlog::info("✓ Session container replaced: {}", handle_->Id().substr(0, 12));
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to restart session container: {}", e.what());
        return false;
    }
}

void SandboxSession::Record(CommandExecutionResult entry) {
    std::lock_guard<std::mutex> data_lock(data_mutex_);
    history_.push_back(std::move(entry));
}

// ============================================================================
// ACCESSORS & CLEANUP
// ============================================================================

std::vector<CommandExecutionResult> SandboxSession::CommandsHistory() const {
    std::lock_guard<std::mutex> data_lock(data_mutex_);
    return history_;
}

SessionState SandboxSession::State() const {
    std::lock_guard<std::mutex> data_lock(data_mutex_);
    return state_;
}

bool SandboxSession::IsClean() const {
    std::lock_guard<std::mutex> data_lock(data_mutex_);
    return cleaned_;
}

void SandboxSession::Clean() {
    std::lock_guard<std::mutex> command_lock(command_mutex_);
    {
        std::lock_guard<std::mutex> data_lock(data_mutex_);
        if (cleaned_) {
            return;
        }
        cleaned_ = true;
        state_.Clear();
    }

    handle_->Destroy();
    spdlog::info("Session cleaned ({} commands executed)", CommandsHistory().size());
}

} // namespace core
} // namespace envbox
