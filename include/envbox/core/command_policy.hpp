/**
 * @file command_policy.hpp
 * @brief Write-intent classification for read-only sessions
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace envbox {
namespace core {

/**
 * @class CommandPolicy
 * @brief Classifies shell commands as read or write
 *
 * A command is split into simple commands on control operators (`;`, `&&`,
 * `||`, `|`, `&`, newlines, `$(`, backticks). A simple command is a write
 * when its program (after `sudo`, `env`, `command`, `nohup`, `time` and
 * `VAR=value` prefixes) mutates the filesystem or system state, or when it
 * redirects output to anything other than `/dev/null` or a descriptor.
 *
 * The check is advisory: the repository is also mounted `:ro` in read-only
 * sessions.
 *
 * **Usage Example**:
 * @code
 * CommandPolicy policy;
 * policy.IsWriteCommand("ls -la | grep foo");       // false
 * policy.IsWriteCommand("echo x > notes.txt");      // true
 * policy.IsWriteCommand("git status && git commit"); // true
 * @endcode
 */
class CommandPolicy {
public:
    CommandPolicy() = default;

    /**
     * @brief Whether the command would modify state
     */
    bool IsWriteCommand(const std::string& command) const;

    /**
     * @brief Rejection reason, or nullopt if the command is allowed
     */
    std::optional<std::string> Check(const std::string& command) const;

    /**
     * @brief Split a command line into simple commands
     *
     * Quoted text is not split. Exposed for tests.
     */
    static std::vector<std::string> SplitSimpleCommands(const std::string& command);

private:
    std::optional<std::string> CheckSimpleCommand(const std::string& simple) const;
};

} // namespace core
} // namespace envbox
