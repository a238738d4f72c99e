/**
 * @file sandbox_session.hpp
 * @brief Stateful interactive shell over a disposable container
 *
 * A SandboxSession gives an agent what looks like one long-lived shell:
 * exported variables and the working directory carry over from command to
 * command, a hung command is cut off and the container replaced without
 * losing that state, and output is truncated to a fixed budget.
 *
 * @date 2025
 */

#pragma once

#include "envbox/core/config.hpp"
#include "envbox/core/container_handle.hpp"
#include "envbox/core/command_policy.hpp"
#include "envbox/core/output_formatter.hpp"
#include "envbox/core/session_state.hpp"
#include "envbox/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace envbox {
namespace core {

using json = nlohmann::json;

/**
 * @struct CommandExecutionResult
 * @brief One entry of a session's command history
 */
struct CommandExecutionResult {
    std::string command;                              ///< Command as submitted
    std::string output;                               ///< Formatted output returned to the caller
    std::optional<int> exit_code;                     ///< nullopt = timeout or engine failure
    std::chrono::system_clock::time_point timestamp;  ///< When execution started

    json ToJson() const;
};

/**
 * @struct BashCommandOutput
 * @brief Value returned by SandboxSession::ExecuteBashCommand()
 */
struct BashCommandOutput {
    std::string output;             ///< Formatted (possibly truncated) output
    std::optional<int> exit_code;   ///< nullopt = rejected, timed out or engine failure
};

/**
 * @class SandboxSession
 * @brief Serialized command executor with shell-state continuity
 *
 * **Command Pipeline**:
 * ```
 * ExecuteBashCommand(cmd)
 *   ├─ read-only? → CommandPolicy::Check → reject (no history entry)
 *   ├─ lock command mutex
 *   ├─ SessionState::BuildScript(cmd, marker)
 *   ├─ ContainerHandle::Exec(script, bash_timeout)
 *   │    ├─ timeout → Restart(), keep state, history += {null}
 *   │    └─ done    → SplitOutput → SessionState::Apply
 *   └─ OutputFormatter::Format → history += {exit_code}
 * ```
 *
 * **Thread Safety**: All public methods are thread-safe. Concurrent
 * ExecuteBashCommand() calls run one after another, in lock order.
 *
 * **Usage Example**:
 * @code
 * utils::ContainerUtils docker;
 * SessionConfig config;
 * config.image = "ghcr.io/jetbrains-research/envbench-python";
 *
 * auto session = SandboxSession::Create(docker, config, "/tmp/repos/owner__name@sha");
 * session->ExecuteBashCommand("export TEST_VAR=hello");
 * auto [output, exit_code] = session->ExecuteBashCommand("echo $TEST_VAR");
 * // output == "hello", exit_code == 0
 * session->Clean();
 * @endcode
 */
class SandboxSession {
public:
    static constexpr const char* kReadOnlyRejection =
        "ERROR: Command rejected: write operations are not allowed in read-only mode.";

    /**
     * @brief Create and start a session container, then run initial commands
     *
     * @param client Engine client (must outlive the session)
     * @param config Session settings
     * @param repo_path Host checkout mounted at `config.mount_path`
     *
     * @throws utils::ContainerError if the container cannot be created or started
     * @throws std::runtime_error if an initial command exits non-zero
     */
    static std::unique_ptr<SandboxSession> Create(utils::ContainerClient& client,
                                                  const SessionConfig& config,
                                                  const std::filesystem::path& repo_path);

    ~SandboxSession();

    SandboxSession(const SandboxSession&) = delete;
    SandboxSession& operator=(const SandboxSession&) = delete;

    /**
     * @brief Run one command as if in a persistent shell
     *
     * Never throws for command-level problems: rejections, timeouts and
     * engine failures come back as an error message with no exit code.
     *
     * @param command Bash command, run verbatim
     * @param add_to_history Record the command in CommandsHistory()
     *
     * @throws std::logic_error if called after Clean()
     */
    BashCommandOutput ExecuteBashCommand(const std::string& command, bool add_to_history = true);

    /**
     * @brief Copy of the history in execution order
     */
    std::vector<CommandExecutionResult> CommandsHistory() const;

    /**
     * @brief Copy of the current shell state
     */
    SessionState State() const;

    /**
     * @brief Remove the container and drop state (idempotent)
     */
    void Clean();

    bool IsClean() const;

    const SessionConfig& Config() const { return config_; }

    /**
     * @brief Message returned for a command cut off after @p timeout
     */
    static std::string DefaultTimeoutMessage(std::chrono::seconds timeout);

private:
    SandboxSession(utils::ContainerClient& client,
                   SessionConfig config,
                   const std::filesystem::path& repo_path);

    void Start();
    bool RecoverContainer();
    void Record(CommandExecutionResult entry);
    std::optional<std::chrono::milliseconds> BashTimeout() const;

    SessionConfig config_;                       ///< Settings
    std::unique_ptr<ContainerHandle> handle_;    ///< Owned container
    CommandPolicy policy_;                       ///< Read-only classifier
    OutputFormatter formatter_;                  ///< Truncation

    mutable std::mutex command_mutex_;           ///< One exec in flight
    mutable std::mutex data_mutex_;              ///< Guards state_, history_, cleaned_
    SessionState state_;                         ///< Replayed shell state
    std::vector<CommandExecutionResult> history_;  ///< Append-only history
    bool cleaned_{false};                        ///< Clean() has run
};

} // namespace core
} // namespace envbox
