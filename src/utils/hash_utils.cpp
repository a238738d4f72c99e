/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 hashing via OpenSSL
 *
 * Digests go through an `EVP_MD_CTX`; an OpenSSL failure is logged and
 * rethrown as std::runtime_error.
 *
 * @date 2025
 */

#include "envbox/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <memory>
#include <random>
#include <chrono>

namespace envbox {
namespace utils {

namespace {

// ============================================================================
// INTERNAL HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Convert binary data to hexadecimal string
 * @param data Binary data buffer
 * @param length Number of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

} // anonymous namespace

// ============================================================================
// SHA-256
// ============================================================================

std::string HashUtils::ComputeSHA256(const std::string& data) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("OpenSSL digest initialization failed");
        throw std::runtime_error("SHA-256 initialization failed");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        spdlog::error("OpenSSL digest update failed ({} bytes)", data.size());
        throw std::runtime_error("SHA-256 update failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        spdlog::error("OpenSSL digest finalization failed");
        throw std::runtime_error("SHA-256 finalization failed");
    }

    return BinaryToHex(hash, length);
}


// ============================================================================
// RANDOM TOKENS
// ============================================================================

std::string HashUtils::RandomToken(std::size_t length) {
    static thread_local std::mt19937_64 gen{std::random_device{}()};

    std::ostringstream seed;
    seed << gen() << ':'
         << std::chrono::steady_clock::now().time_since_epoch().count();

    std::string digest = ComputeSHA256(seed.str());
    return digest.substr(0, std::min<std::size_t>(length, digest.size()));
}

} // namespace utils
} // namespace envbox
