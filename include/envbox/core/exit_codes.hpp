/**
 * @file exit_codes.hpp
 * @brief Reserved exit codes for infrastructure failures in batch runs
 *
 * A build record's `exit_code` is either the user script's own status
 * (0 or positive) or one of these negative sentinels.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace envbox {
namespace core {
namespace exit_codes {

constexpr int SUCCESS = 0;
constexpr int TIMEOUT = -127;                   ///< Global container timeout exceeded
constexpr int UNKNOWN_FAILURE = -999;           ///< Unexpected exception in the runner
constexpr int DOCKER_FAILURE = -888;            ///< Engine error (create/start/wait/logs)
constexpr int CREATE_CONTAINER_FAILURE = -777;  ///< Image pull failed or create timed out
constexpr int DOWNLOAD_FAILURE = -666;          ///< Repository checkout unavailable
constexpr int SCRIPT_FAILURE = -555;            ///< Build script could not be prepared

/**
 * @brief Human-readable name of an exit code
 * @return "TIMEOUT", "DOCKER_FAILURE", ..., "SUCCESS" or "EXIT_<n>"
 */
std::string Describe(int exit_code);

/**
 * @brief Check whether a code is one of the reserved sentinels
 */
bool IsSentinel(int exit_code);

} // namespace exit_codes
} // namespace core
} // namespace envbox
