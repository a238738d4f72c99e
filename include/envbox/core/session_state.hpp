/**
 * @file session_state.hpp
 * @brief Shell state carried across independent exec calls
 *
 * Every command of a session runs in a fresh `bash -c` process. To present
 * the illusion of one persistent shell, the exported environment and the
 * working directory are captured after each command and replayed before the
 * next one.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <map>
#include <set>
#include <optional>

#include <nlohmann/json.hpp>

namespace envbox {
namespace core {

using json = nlohmann::json;

/**
 * @struct StateSnapshot
 * @brief Shell state observed at the end of one command
 */
struct StateSnapshot {
    int exit_code{0};                                ///< Status the command finished with
    std::string working_dir;                         ///< `pwd` at exit
    std::map<std::string, std::string> environment;  ///< Exported variables at exit
};

/**
 * @struct SplitResult
 * @brief User-visible output separated from the trailing state snapshot
 */
struct SplitResult {
    std::string output;                      ///< Everything printed before the marker
    std::optional<StateSnapshot> snapshot;   ///< nullopt if the marker never appeared
};

/**
 * @class SessionState
 * @brief Serializable snapshot of exported variables, cwd and last status
 *
 * **Script Layout** (generated by BuildScript()):
 * ```
 * __envbox_capture() { ... print MARKER, $?, pwd, env -0 ...; }
 * trap __envbox_capture EXIT
 * unset <vars removed by earlier commands>
 * export K='v' ...
 * cd -- '<cwd>'
 * <user command, verbatim>
 * ```
 *
 * The EXIT trap fires for normal completion and for an explicit `exit N`,
 * so state is captured whatever the command's status.
 */
class SessionState {
public:
    SessionState() = default;

    const std::map<std::string, std::string>& Environment() const { return environment_; }
    const std::set<std::string>& UnsetVariables() const { return unset_variables_; }
    const std::optional<std::string>& WorkingDirectory() const { return working_dir_; }
    std::optional<int> LastExitCode() const { return last_exit_code_; }

    void SetVariable(const std::string& name, const std::string& value);
    void SetWorkingDirectory(const std::string& path);
    void SetLastExitCode(std::optional<int> exit_code) { last_exit_code_ = exit_code; }

    /**
     * @brief Fold a captured snapshot into the state
     *
     * Variables present before but missing from the snapshot are
     * remembered so that later scripts unset them again.
     */
    void Apply(const StateSnapshot& snapshot);

    /**
     * @brief Drop all state
     */
    void Clear();

    /**
     * @brief Wrap a command into a self-contained bash script
     * @param command User command (run verbatim)
     * @param marker Unique per-call marker from NewMarker()
     * @return Script for `bash -c`
     */
    std::string BuildScript(const std::string& command, const std::string& marker) const;

    /**
     * @brief Separate command output from the state snapshot
     *
     * Looks for the last "\n<marker>\n" in @p raw. Everything before it is
     * user output; the remainder is the exit status line, the pwd line and
     * the NUL-separated environment.
     */
    static SplitResult SplitOutput(const std::string& raw, const std::string& marker);

    /**
     * @brief Fresh random marker
     */
    static std::string NewMarker();

    /**
     * @brief Whether a variable is replayed between commands
     *
     * Shell-maintained variables (PWD, SHLVL, _, ...) and names that are not
     * valid identifiers are not replayed.
     */
    static bool IsReplayable(const std::string& name);

    json ToJson() const;
    static SessionState FromJson(const json& j);

private:
    std::map<std::string, std::string> environment_;  ///< Exported variables
    std::set<std::string> unset_variables_;           ///< Removed since session start
    std::optional<std::string> working_dir_;          ///< Last working directory
    std::optional<int> last_exit_code_;               ///< Last command status
};

} // namespace core
} // namespace envbox
