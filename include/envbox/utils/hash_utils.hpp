/**
 * @file hash_utils.hpp
 * @brief SHA-256 hashing utilities
 *
 * Fingerprints injected scripts (the `script_sha256` field of a build record)
 * and derives short unique suffixes for container names.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace envbox {
namespace utils {

/**
 * @class HashUtils
 * @brief SHA-256 helpers backed by OpenSSL
 *
 * All methods are static and thread-safe.
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256(bootstrap_script);
 * // 64 lowercase hex characters
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 hash of string
     * @param data String to hash
     * @return 64-character lowercase hex digest
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Short random hex token
     *
     * Hashes a random seed with the current time; used to make container
     * names and session markers unique.
     *
     * @param length Number of hex characters (max 64)
     * @return Random hex string
     */
    static std::string RandomToken(std::size_t length = 12);
};

} // namespace utils
} // namespace envbox
