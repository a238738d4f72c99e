/**
 * @file container_handle.hpp
 * @brief Owning handle over one container's lifecycle
 *
 * A ContainerHandle remembers the configuration a container was created
 * from, so it can be force-removed and recreated identically after a
 * timeout. The bind-mounted repository directory lives on the host and
 * survives such a restart.
 *
 * @date 2025
 */

#pragma once

#include "envbox/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace envbox {
namespace core {

/**
 * @class ContainerHandle
 * @brief RAII owner of a single container
 *
 * **Lifecycle**:
 * ```
 * PENDING ─Create()→ CREATED ─Start()→ RUNNING ─(exits)→ EXITED
 *    ↑                                    │
 *    └──────────── Restart() ─────────────┘
 * any ─Destroy()→ REMOVED
 * ```
 *
 * The destructor calls Destroy(), so a live container is removed on every
 * exit path of the owning scope.
 *
 * **Thread Safety**: NOT thread-safe. Callers serialize access (a session
 * holds its command mutex around every call).
 *
 * **Usage Example**:
 * @code
 * utils::ContainerUtils docker;
 * ContainerHandle handle(docker, config);
 * handle.Create(std::chrono::seconds(180));
 * handle.Start();
 * auto result = handle.Exec("echo hello", std::chrono::seconds(5));
 * // handle goes out of scope → container removed
 * @endcode
 */
class ContainerHandle {
public:
    /**
     * @brief Bind a handle to a client and configuration
     * @param client Engine client (must outlive the handle)
     * @param config Container configuration reused on Restart()
     */
    ContainerHandle(utils::ContainerClient& client, utils::ContainerConfig config);

    ~ContainerHandle();

    ContainerHandle(const ContainerHandle&) = delete;
    ContainerHandle& operator=(const ContainerHandle&) = delete;

    /**
     * @brief Create the container, pulling the image first if absent
     *
     * @param timeout Deadline for the pull and for the create call each
     *
     * @throws utils::ImagePullError if the image cannot be pulled
     * @throws utils::ContainerCreateTimeout if creation exceeds @p timeout
     * @throws utils::ContainerEngineError on daemon errors
     * @throws std::logic_error if a container already exists
     */
    void Create(std::optional<std::chrono::milliseconds> timeout);

    /**
     * @brief Start the created container
     * @throws utils::ContainerEngineError on failure
     */
    void Start();

    /**
     * @brief Run a bash script in the running container
     *
     * Executes `/bin/bash -c <script>` as an independent exec call. On
     * timeout the result has no exit code and the container may be left
     * with a runaway process; callers typically Restart().
     *
     * @throws std::logic_error if the container is not running
     */
    utils::ContainerExecResult Exec(const std::string& script,
                                    std::optional<std::chrono::milliseconds> timeout);

    /**
     * @brief Wait for the container's main process to exit
     * @return Exit status
     * @throws utils::ContainerTimeout, utils::ContainerEngineError
     */
    int Wait(std::optional<std::chrono::milliseconds> timeout);

    /**
     * @brief Combined stdout+stderr of the main process
     * @throws utils::ContainerTimeout, utils::ContainerEngineError
     */
    std::string Logs(std::optional<std::chrono::milliseconds> timeout);

    /**
     * @brief Kill the main process
     * @throws utils::ContainerEngineError on failure
     */
    void Kill();

    /**
     * @brief Force-remove and recreate from the same image and mounts
     *
     * In-container process state and non-mounted files are lost.
     *
     * @param timeout Deadline for the create call
     */
    void Restart(std::optional<std::chrono::milliseconds> timeout);

    /**
     * @brief Remove the container (idempotent, never throws)
     *
     * Engine errors are logged and swallowed.
     */
    void Destroy() noexcept;

    const std::string& Id() const { return container_id_; }
    utils::ContainerState State() const { return state_; }
    const utils::ContainerConfig& Config() const { return config_; }
    bool IsRunning() const { return state_ == utils::ContainerState::RUNNING; }

private:
    utils::ContainerClient& client_;                    ///< Engine client
    utils::ContainerConfig config_;                     ///< Creation parameters
    std::string container_id_;                          ///< Engine id (empty if none)
    utils::ContainerState state_{utils::ContainerState::PENDING};  ///< Tracked state
};

} // namespace core
} // namespace envbox
