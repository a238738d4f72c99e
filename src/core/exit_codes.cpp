#include "envbox/core/exit_codes.hpp"

namespace envbox {
namespace core {
namespace exit_codes {

std::string Describe(int exit_code) {
    switch (exit_code) {
        case SUCCESS: return "SUCCESS";
        case TIMEOUT: return "TIMEOUT";
        case UNKNOWN_FAILURE: return "UNKNOWN_FAILURE";
        case DOCKER_FAILURE: return "DOCKER_FAILURE";
        case CREATE_CONTAINER_FAILURE: return "CREATE_CONTAINER_FAILURE";
        case DOWNLOAD_FAILURE: return "DOWNLOAD_FAILURE";
        case SCRIPT_FAILURE: return "SCRIPT_FAILURE";
        default: return "EXIT_" + std::to_string(exit_code);
    }
}

bool IsSentinel(int exit_code) {
    switch (exit_code) {
        case TIMEOUT:
        case UNKNOWN_FAILURE:
        case DOCKER_FAILURE:
        case CREATE_CONTAINER_FAILURE:
        case DOWNLOAD_FAILURE:
        case SCRIPT_FAILURE:
            return true;
        default:
            return false;
    }
}

} // namespace exit_codes
} // namespace core
} // namespace envbox
