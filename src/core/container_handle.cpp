/**
 * @file container_handle.cpp
 * @brief Implementation of the RAII container handle
 *
 * @date 2025
 */

#include "envbox/core/container_handle.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace envbox {
namespace core {

ContainerHandle::ContainerHandle(utils::ContainerClient& client, utils::ContainerConfig config)
    : client_(client)
    , config_(std::move(config)) {
}

ContainerHandle::~ContainerHandle() {
    Destroy();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void ContainerHandle::Create(std::optional<std::chrono::milliseconds> timeout) {
    if (!container_id_.empty()) {
        throw std::logic_error("Container already exists: " + container_id_);
    }

    if (!client_.ImageExists(config_.image)) {
        spdlog::info("Image {} not present locally", config_.image);
        client_.PullImage(config_.image, timeout);
    }

    container_id_ = client_.CreateContainer(config_, timeout);
    state_ = utils::ContainerState::CREATED;
}

void ContainerHandle::Start() {
    if (state_ != utils::ContainerState::CREATED) {
        throw std::logic_error("Container cannot be started from state " +
                               utils::ContainerStateToString(state_));
    }
    client_.StartContainer(container_id_);
    state_ = utils::ContainerState::RUNNING;
}

utils::ContainerExecResult ContainerHandle::Exec(const std::string& script,
                                                 std::optional<std::chrono::milliseconds> timeout) {
    if (state_ != utils::ContainerState::RUNNING) {
        throw std::logic_error("Exec requires a running container (state: " +
                               utils::ContainerStateToString(state_) + ")");
    }
    return client_.ExecuteCommand(container_id_, {"/bin/bash", "-c", script}, timeout);
}

int ContainerHandle::Wait(std::optional<std::chrono::milliseconds> timeout) {
    int exit_code = client_.WaitForContainer(container_id_, timeout);
    state_ = utils::ContainerState::EXITED;
    return exit_code;
}

std::string ContainerHandle::Logs(std::optional<std::chrono::milliseconds> timeout) {
    return client_.GetContainerLogs(container_id_, timeout);
}

void ContainerHandle::Kill() {
    client_.KillContainer(container_id_);
    state_ = utils::ContainerState::EXITED;
}

void ContainerHandle::Restart(std::optional<std::chrono::milliseconds> timeout) {
    spdlog::warn("Restarting container {} from image {}",
                 container_id_.substr(0, 12), config_.image);

    if (!container_id_.empty()) {
        try {
            client_.RemoveContainer(container_id_, true);
        } catch (const utils::ContainerError& e) {
            spdlog::warn("Removing container {} before restart failed: {}",
                         container_id_.substr(0, 12), e.what());
        }
        container_id_.clear();
        state_ = utils::ContainerState::REMOVED;
    }

    Create(timeout);
    Start();
}

void ContainerHandle::Destroy() noexcept {
    if (container_id_.empty()) {
        return;
    }

    try {
        client_.RemoveContainer(container_id_, true);
        spdlog::debug("Container {} removed", container_id_.substr(0, 12));
    } catch (const std::exception& e) {
        spdlog::warn("Failed to remove container {}: {}", container_id_.substr(0, 12), e.what());
    }

    container_id_.clear();
    state_ = utils::ContainerState::REMOVED;
}

} // namespace core
} // namespace envbox
