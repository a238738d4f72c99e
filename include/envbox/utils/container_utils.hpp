/**
 * @file container_utils.hpp
 * @brief Container engine client abstraction and Docker CLI implementation
 *
 * Declares the ContainerClient seam used by every higher layer (handles,
 * sessions, batch runners) together with the Docker implementation that
 * drives the `docker` command line. Tests substitute their own client.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>
#include <stdexcept>

namespace envbox {
namespace utils {

struct ProcessResult;

/**
 * @enum ContainerState
 * @brief Container lifecycle states as tracked by a handle
 */
enum class ContainerState {
    PENDING,   ///< Not yet created
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    EXITED,    ///< Container exited
    REMOVED,   ///< Container removed from the engine
    UNKNOWN    ///< Unknown state
};

/**
 * @brief Lowercase name of a container state ("pending", "running", ...)
 */
std::string ContainerStateToString(ContainerState state);

/**
 * @enum NetworkMode
 * @brief Container network modes
 */
enum class NetworkMode {
    DEFAULT,     ///< Engine default (no --network flag)
    NONE,        ///< No network access
    BRIDGE,      ///< Bridge network
    HOST         ///< Host network
};

/**
 * @struct Mount
 * @brief Host directory bind-mounted into the container
 */
struct Mount {
    std::filesystem::path host_path;      ///< Absolute host path
    std::string container_path;           ///< Mount point inside the container
    bool read_only{false};                ///< Append `:ro` to the bind
};

/**
 * @struct ContainerConfig
 * @brief Complete container configuration
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                           ///< Container name (empty = engine generated)
    std::string image;                          ///< Image reference
    std::vector<std::string> command;           ///< Entrypoint arguments

    // Filesystem Settings
    std::vector<Mount> mounts;                  ///< Bind mounts
    std::string working_dir;                    ///< Working directory (empty = image default)

    // Environment
    std::map<std::string, std::string> environment_vars;  ///< Environment variables

    // Resource Limits
    std::size_t memory_limit_mb{0};             ///< Memory limit (0 = unlimited)

    // Network / Metadata
    NetworkMode network_mode{NetworkMode::DEFAULT};  ///< Network mode
    std::map<std::string, std::string> labels;       ///< Labels for bookkeeping
};

/**
 * @struct ContainerExecResult
 * @brief Result of command execution in container
 */
struct ContainerExecResult {
    std::optional<int> exit_code;           ///< Exit code (nullopt = timed out)
    std::string output;                     ///< Combined stdout+stderr
    bool timed_out{false};                  ///< Deadline reached, exec client killed
    std::chrono::milliseconds duration{0};  ///< Execution duration
};

// ============================================================================
// ERRORS
// ============================================================================

/**
 * @class ContainerError
 * @brief Base class for container infrastructure failures
 */
class ContainerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Image could not be pulled from the registry
class ImagePullError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

/// Container creation did not finish within its deadline
class ContainerCreateTimeout : public ContainerError {
public:
    using ContainerError::ContainerError;
};

/// Waiting for the container or collecting its logs exceeded the deadline
class ContainerTimeout : public ContainerError {
public:
    using ContainerError::ContainerError;
};

/// The engine reported an error (daemon unreachable, bad request, ...)
class ContainerEngineError : public ContainerError {
public:
    using ContainerError::ContainerError;
};

// ============================================================================
// CLIENT INTERFACE
// ============================================================================

/**
 * @class ContainerClient
 * @brief Abstract container engine client
 *
 * One client is owned by the caller and injected into handles, sessions and
 * runners. Implementations must be safe to call from multiple threads for
 * different containers.
 */
class ContainerClient {
public:
    virtual ~ContainerClient() = default;

    /**
     * @brief Check whether an image is present locally
     * @param image Image reference
     * @return true if present
     */
    virtual bool ImageExists(const std::string& image) = 0;

    /**
     * @brief Pull image from its registry
     * @throws ImagePullError on failure or timeout
     */
    virtual void PullImage(const std::string& image,
                           std::optional<std::chrono::milliseconds> timeout) = 0;

    /**
     * @brief Create (but do not start) a container
     * @return Container ID
     * @throws ContainerCreateTimeout if the deadline passes
     * @throws ContainerEngineError on engine failure
     */
    virtual std::string CreateContainer(const ContainerConfig& config,
                                        std::optional<std::chrono::milliseconds> timeout) = 0;

    /**
     * @brief Start a created container
     * @throws ContainerEngineError on failure
     */
    virtual void StartContainer(const std::string& container_id) = 0;

    /**
     * @brief Run a command in a running container
     *
     * A timeout is not an error: the result carries `timed_out` and no exit
     * code. The command may keep running inside the container.
     *
     * @throws ContainerEngineError if the exec could not be launched
     */
    virtual ContainerExecResult ExecuteCommand(const std::string& container_id,
                                               const std::vector<std::string>& command,
                                               std::optional<std::chrono::milliseconds> timeout) = 0;

    /**
     * @brief Block until the container exits
     * @return Container exit code
     * @throws ContainerTimeout if the deadline passes
     * @throws ContainerEngineError on engine failure
     */
    virtual int WaitForContainer(const std::string& container_id,
                                 std::optional<std::chrono::milliseconds> timeout) = 0;

    /**
     * @brief Collect combined stdout+stderr of a container
     * @throws ContainerTimeout if the deadline passes
     * @throws ContainerEngineError on engine failure
     */
    virtual std::string GetContainerLogs(const std::string& container_id,
                                         std::optional<std::chrono::milliseconds> timeout) = 0;

    /**
     * @brief Kill container forcefully
     * @throws ContainerEngineError on failure
     */
    virtual void KillContainer(const std::string& container_id) = 0;

    /**
     * @brief Remove container
     * @param force Kill first if running
     * @throws ContainerEngineError on failure
     */
    virtual void RemoveContainer(const std::string& container_id, bool force) = 0;
};

// ============================================================================
// DOCKER CLI IMPLEMENTATION
// ============================================================================

/**
 * @class ContainerUtils
 * @brief ContainerClient driving the `docker` command line
 *
 * Each operation spawns one `docker` subprocess through RunProcess(), so
 * every call carries its own deadline and a stuck client is killed together
 * with its process group.
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker;
 *
 * auto config = ContainerBuilder()
 *     .WithImage("python:3.11")
 *     .WithMount("/tmp/checkout", "/data/project")
 *     .WithWorkingDir("/data/project")
 *     .WithCommand({"sleep", "infinity"})
 *     .Build();
 *
 * std::string id = docker.CreateContainer(config, std::chrono::seconds(180));
 * docker.StartContainer(id);
 * auto result = docker.ExecuteCommand(id, {"/bin/bash", "-c", "ls"}, std::chrono::seconds(5));
 * docker.RemoveContainer(id, true);
 * @endcode
 */
class ContainerUtils : public ContainerClient {
public:
    /**
     * @brief Construct client for a docker-compatible binary
     * @param docker_binary Program name or path ("docker", "podman", ...)
     */
    explicit ContainerUtils(std::string docker_binary = "docker");

    /**
     * @brief Check if container runtime is available
     * @param docker_binary Program to probe
     * @return true if `<binary> --version` succeeds
     */
    static bool IsRuntimeAvailable(const std::string& docker_binary = "docker");

    /**
     * @brief Get runtime version string
     * @return Version (x.y.z) or "unknown"
     */
    static std::string GetRuntimeVersion(const std::string& docker_binary = "docker");

    /**
     * @brief Translate a configuration into `docker create` arguments
     *
     * The result excludes the binary itself and starts with "create".
     */
    static std::vector<std::string> BuildCreateArgs(const ContainerConfig& config);

    /**
     * @brief Map a docker state string ("running", "exited", ...) to ContainerState
     */
    static ContainerState ParseState(const std::string& state_str);

    bool ImageExists(const std::string& image) override;
    void PullImage(const std::string& image,
                   std::optional<std::chrono::milliseconds> timeout) override;
    std::string CreateContainer(const ContainerConfig& config,
                                std::optional<std::chrono::milliseconds> timeout) override;
    void StartContainer(const std::string& container_id) override;
    ContainerExecResult ExecuteCommand(const std::string& container_id,
                                       const std::vector<std::string>& command,
                                       std::optional<std::chrono::milliseconds> timeout) override;
    int WaitForContainer(const std::string& container_id,
                         std::optional<std::chrono::milliseconds> timeout) override;
    std::string GetContainerLogs(const std::string& container_id,
                                 std::optional<std::chrono::milliseconds> timeout) override;
    void KillContainer(const std::string& container_id) override;
    void RemoveContainer(const std::string& container_id, bool force) override;

    /**
     * @brief Query the engine-side state of a container
     * @return REMOVED if the engine does not know the container
     */
    ContainerState GetContainerState(const std::string& container_id);

private:
    std::string docker_binary_;  ///< Runtime executable

    ProcessResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                       bool merge_stderr = false) const;
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithCommand(const std::vector<std::string>& command);
    ContainerBuilder& WithMount(const std::filesystem::path& host,
                                const std::string& container,
                                bool read_only = false);
    ContainerBuilder& WithWorkingDir(const std::string& working_dir);
    ContainerBuilder& WithEnvironment(const std::string& key,
                                      const std::string& value);
    ContainerBuilder& WithMemoryLimit(std::size_t mb);
    ContainerBuilder& WithNetwork(NetworkMode mode);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);

    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace utils
} // namespace envbox
