/**
 * @file process_utils.hpp
 * @brief Subprocess execution with deadline-based cancellation
 *
 * Runs an external program (usually the container engine CLI) with captured
 * output and an optional wall-clock deadline. When the deadline passes the
 * whole process group of the child is killed and the result is marked as
 * timed out.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>

namespace envbox {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Execution parameters for RunProcess()
 */
struct ProcessOptions {
    std::optional<std::chrono::milliseconds> timeout;    ///< Wall-clock limit (none = unbounded)
    bool merge_stderr{false};                            ///< Send stderr into stdout_output
    std::optional<std::filesystem::path> working_dir;    ///< Child working directory
    std::string stdin_data;                              ///< Bytes written to child stdin
};

/**
 * @struct ProcessResult
 * @brief Outcome of a finished (or cancelled) child process
 */
struct ProcessResult {
    std::optional<int> exit_code;           ///< Exit status; nullopt when timed out
    std::string stdout_output;              ///< Captured stdout (and stderr if merged)
    std::string stderr_output;              ///< Captured stderr (empty if merged)
    bool timed_out{false};                  ///< Deadline reached, child killed
    int term_signal{0};                     ///< Terminating signal, 0 if exited normally
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime

    bool Succeeded() const { return exit_code.has_value() && *exit_code == 0; }
};

/**
 * @brief Run a program and capture its output
 *
 * The child is started in its own process group with stdin connected to
 * @p options.stdin_data (or /dev/null). A child killed by a signal reports
 * `128 + signal` as its exit code, following shell convention.
 *
 * @param argv Program and arguments; argv[0] is resolved through PATH
 * @param options Execution options
 * @return Process result
 *
 * @throws std::invalid_argument if argv is empty
 * @throws std::system_error if pipes or the child cannot be created
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options = {});

/**
 * @brief Check whether a program can be found on PATH
 * @param program Program name or path
 * @return true if executable
 */
bool IsExecutableAvailable(const std::string& program);

} // namespace utils
} // namespace envbox
