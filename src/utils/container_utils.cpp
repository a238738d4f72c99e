/**
 * @file container_utils.cpp
 * @brief Implementation of the Docker CLI container client
 *
 * Every engine operation is one `docker` subprocess:
 * ```
 * ImageExists      → docker image inspect <image>
 * PullImage        → docker pull <image>
 * CreateContainer  → docker create [--name] [-w] [-v ...] [-e ...] <image> <cmd...>
 * StartContainer   → docker start <id>
 * ExecuteCommand   → docker exec <id> <argv...>          (stderr merged)
 * WaitForContainer → docker wait <id>
 * GetContainerLogs → docker logs <id>                    (stderr merged)
 * KillContainer    → docker kill <id>
 * RemoveContainer  → docker rm [-f] <id>
 * ```
 *
 * Arguments are passed as an argv vector, never through a shell, so
 * scripts and paths need no quoting.
 *
 * @date 2025
 */

#include "envbox/utils/container_utils.hpp"
#include "envbox/utils/process_utils.hpp"
#include "envbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>

namespace envbox {
namespace utils {

namespace {

std::string DescribeFailure(const ProcessResult& result) {
    std::string text = StringUtils::Trim(result.stderr_output);
    if (text.empty()) {
        text = StringUtils::Trim(result.stdout_output);
    }
    if (text.empty()) {
        text = "exit code " + (result.exit_code ? std::to_string(*result.exit_code)
                                                : std::string("unknown"));
    }
    return text;
}

} // anonymous namespace

std::string ContainerStateToString(ContainerState state) {
    switch (state) {
        case ContainerState::PENDING: return "pending";
        case ContainerState::CREATED: return "created";
        case ContainerState::RUNNING: return "running";
        case ContainerState::EXITED: return "exited";
        case ContainerState::REMOVED: return "removed";
        default: return "unknown";
    }
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ContainerUtils::ContainerUtils(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {
    spdlog::debug("Container client initialized with runtime: {}", docker_binary_);
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable(const std::string& docker_binary) {
    if (!IsExecutableAvailable(docker_binary)) {
        return false;
    }
    try {
        ProcessOptions options;
        options.timeout = std::chrono::seconds(10);
        auto result = RunProcess({docker_binary, "version", "--format", "{{.Server.Version}}"}, options);
        return result.Succeeded();
    } catch (const std::exception& e) {
        spdlog::debug("Runtime probe failed: {}", e.what());
        return false;
    }
}

std::string ContainerUtils::GetRuntimeVersion(const std::string& docker_binary) {
    try {
        ProcessOptions options;
        options.timeout = std::chrono::seconds(10);
        auto result = RunProcess({docker_binary, "--version"}, options);
        if (result.Succeeded()) {
            // Extract version number using regex (matches x.y.z format)
            std::regex version_regex(R"((\d+\.\d+\.\d+))");
            std::smatch match;
            if (std::regex_search(result.stdout_output, match, version_regex)) {
                return match[1].str();
            }
            return StringUtils::Trim(result.stdout_output);
        }
    } catch (const std::exception& e) {
        spdlog::debug("Runtime version probe failed: {}", e.what());
    }
    return "unknown";
}

// ============================================================================
// IMAGES
// ============================================================================

bool ContainerUtils::ImageExists(const std::string& image) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image},
                                       std::chrono::seconds(30));
    return result.Succeeded();
}

void ContainerUtils::PullImage(const std::string& image,
                               std::optional<std::chrono::milliseconds> timeout) {
    spdlog::info("Pulling image: {}", image);

    auto result = ExecuteDockerCommand({"pull", image}, timeout);
    if (result.timed_out) {
        throw ImagePullError("Timed out pulling image " + image);
    }
    if (!result.Succeeded()) {
        throw ImagePullError("Failed to pull image " + image + ": " + DescribeFailure(result));
    }

    spdlog::info("Image pulled: {}", image);
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config,
                                            std::optional<std::chrono::milliseconds> timeout) {
    spdlog::info("Creating container: {} ({})",
                 config.name.empty() ? "<unnamed>" : config.name, config.image);

    auto result = ExecuteDockerCommand(BuildCreateArgs(config), timeout);

    if (result.timed_out) {
        // The daemon may still finish the request after the client is gone
        if (!config.name.empty()) {
            try {
                ExecuteDockerCommand({"rm", "-f", config.name}, std::chrono::seconds(30));
            } catch (const std::exception& e) {
                spdlog::warn("Failed to remove half-created container {}: {}", config.name, e.what());
            }
        }
        throw ContainerCreateTimeout("Timed out creating container from image " + config.image);
    }
    if (!result.Succeeded()) {
        throw ContainerEngineError("Failed to create container: " + DescribeFailure(result));
    }

    std::string container_id = StringUtils::Trim(result.stdout_output);
    if (container_id.empty()) {
        throw ContainerEngineError("Engine returned an empty container id");
    }

    spdlog::info("Container created: {}", container_id.substr(0, 12));
    return container_id;
}

std::vector<std::string> ContainerUtils::BuildCreateArgs(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    // Container name
    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Working directory
    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    // Bind mounts
    for (const auto& mount : config.mounts) {
        std::string bind = mount.host_path.string() + ":" + mount.container_path;
        if (mount.read_only) {
            bind += ":ro";
        }
        args.push_back("-v");
        args.push_back(bind);
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    // Memory limit
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }

    // Network mode
    switch (config.network_mode) {
        case NetworkMode::NONE:
            args.push_back("--network");
            args.push_back("none");
            break;
        case NetworkMode::BRIDGE:
            args.push_back("--network");
            args.push_back("bridge");
            break;
        case NetworkMode::HOST:
            args.push_back("--network");
            args.push_back("host");
            break;
        default:
            break;
    }

    // Labels
    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    args.push_back(config.image);

    for (const auto& arg : config.command) {
        args.push_back(arg);
    }

    return args;
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

void ContainerUtils::StartContainer(const std::string& container_id) {
    spdlog::info("Starting container: {}", container_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"start", container_id}, std::chrono::seconds(120));
    if (!result.Succeeded()) {
        throw ContainerEngineError("Failed to start container: " + DescribeFailure(result));
    }
}

void ContainerUtils::KillContainer(const std::string& container_id) {
    spdlog::info("Killing container: {}", container_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"kill", container_id}, std::chrono::seconds(60));
    if (!result.Succeeded()) {
        throw ContainerEngineError("Failed to kill container: " + DescribeFailure(result));
    }
}

void ContainerUtils::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::info("Removing container: {}", container_id.substr(0, 12));

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args, std::chrono::seconds(120));
    if (!result.Succeeded()) {
        throw ContainerEngineError("Failed to remove container: " + DescribeFailure(result));
    }
}

ContainerState ContainerUtils::GetContainerState(const std::string& container_id) {
    auto result = ExecuteDockerCommand({"inspect", "--format", "{{.State.Status}}", container_id},
                                       std::chrono::seconds(30));
    if (!result.Succeeded()) {
        return ContainerState::REMOVED;
    }
    return ParseState(StringUtils::Trim(result.stdout_output));
}

// ============================================================================
// EXECUTION
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteCommand(const std::string& container_id,
                                                   const std::vector<std::string>& command,
                                                   std::optional<std::chrono::milliseconds> timeout) {
    std::vector<std::string> args = {"exec", container_id};
    args.insert(args.end(), command.begin(), command.end());

    auto result = ExecuteDockerCommand(args, timeout, true);

    ContainerExecResult exec_result;
    exec_result.output = std::move(result.stdout_output);
    exec_result.duration = result.duration;
    exec_result.timed_out = result.timed_out;
    if (!result.timed_out) {
        exec_result.exit_code = result.exit_code;
    }

    // The user command may print daemon-like text itself; only a container
    // that is no longer running makes it an engine failure
    if (exec_result.exit_code && *exec_result.exit_code != 0 &&
        StringUtils::StartsWith(exec_result.output, "Error response from daemon")) {
        ContainerState state = GetContainerState(container_id);
        if (state != ContainerState::RUNNING) {
            spdlog::warn("Exec into {} failed, container is {}",
                         container_id.substr(0, 12), ContainerStateToString(state));
            throw ContainerEngineError("Exec failed: " + StringUtils::Trim(exec_result.output));
        }
    }

    return exec_result;
}

// ============================================================================
// WAITING AND LOGS
// ============================================================================

int ContainerUtils::WaitForContainer(const std::string& container_id,
                                     std::optional<std::chrono::milliseconds> timeout) {
    spdlog::info("Waiting for container to exit: {}", container_id.substr(0, 12));

    auto result = ExecuteDockerCommand({"wait", container_id}, timeout);
    if (result.timed_out) {
        throw ContainerTimeout("Timed out waiting for container " + container_id);
    }
    if (!result.Succeeded()) {
        throw ContainerEngineError("Failed to wait for container: " + DescribeFailure(result));
    }

    try {
        return std::stoi(StringUtils::Trim(result.stdout_output));
    } catch (const std::exception&) {
        throw ContainerEngineError("Unexpected wait output: " + result.stdout_output);
    }
}

std::string ContainerUtils::GetContainerLogs(const std::string& container_id,
                                             std::optional<std::chrono::milliseconds> timeout) {
    auto result = ExecuteDockerCommand({"logs", container_id}, timeout, true);
    if (result.timed_out) {
        throw ContainerTimeout("Timed out collecting logs of container " + container_id);
    }
    if (!result.Succeeded()) {
        throw ContainerEngineError("Failed to collect logs: " + DescribeFailure(result));
    }
    return result.stdout_output;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ProcessResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                   std::optional<std::chrono::milliseconds> timeout,
                                                   bool merge_stderr) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    if (spdlog::should_log(spdlog::level::debug)) {
        spdlog::debug("Executing: {}", StringUtils::Truncate(StringUtils::Join(argv, " "), 512));
    }

    ProcessOptions options;
    options.timeout = timeout;
    options.merge_stderr = merge_stderr;

    try {
        return RunProcess(argv, options);
    } catch (const std::system_error& e) {
        throw ContainerEngineError(std::string("Failed to run ") + docker_binary_ + ": " + e.what());
    }
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::RUNNING;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "removing") return ContainerState::REMOVED;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::EXITED;
    return ContainerState::UNKNOWN;
}

// ============================================================================
// CONTAINER BUILDER IMPLEMENTATION (FLUENT API)
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCommand(const std::vector<std::string>& command) {
    config_.command = command;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const std::filesystem::path& host,
                                              const std::string& container,
                                              bool read_only) {
    config_.mounts.push_back(Mount{host, container, read_only});
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::string& working_dir) {
    config_.working_dir = working_dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key,
                                                    const std::string& value) {
    config_.environment_vars[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::size_t mb) {
    config_.memory_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(NetworkMode mode) {
    config_.network_mode = mode;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key, const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace envbox
