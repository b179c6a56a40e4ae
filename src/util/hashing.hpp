#ifndef PHIGUARD_UTIL_HASHING_HPP
#define PHIGUARD_UTIL_HASHING_HPP

#include <array>
#include <cstdint>
#include <string>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief Keyed hashing routines used for pseudonyms and subject date offsets.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - HMAC-SHA256 keyed by the process-wide salt; output as raw digest or lowercase hex.
 *   - hmacCode() truncates the hex digest to a pseudonym code, never shorter than
 *     kMinCodeLength characters.
 *
 * USAGE:
 *   @code
 *   using namespace phiguard::util::hashing;
 *
 *   std::string code = hmacCode("salt", "NAME:john smith", 8);
 *   // code is the first 8 hex characters of HMAC-SHA256(salt, message)
 *   @endcode
 */

namespace phiguard {
namespace util {
namespace hashing {

using Digest = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

/// Pseudonym codes are never shorter than this many hex characters.
constexpr std::size_t kMinCodeLength = 8;

/**
 * @brief Compute HMAC-SHA256(key, message).
 * @throw std::runtime_error if OpenSSL fails.
 */
inline Digest hmacSha256(const std::string &key, const std::string &message)
{
    Digest digest{};
    unsigned int outLen = 0;
    unsigned char *res = HMAC(EVP_sha256(),
                              key.data(), static_cast<int>(key.size()),
                              reinterpret_cast<const unsigned char*>(message.data()),
                              message.size(),
                              digest.data(), &outLen);
    if (res == nullptr || outLen != digest.size()) {
        throw std::runtime_error("hashing::hmacSha256: HMAC computation failed.");
    }
    return digest;
}

/**
 * @brief Lowercase hex encoding of a digest (64 characters).
 */
inline std::string toHex(const Digest &digest)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : digest) {
        oss << std::setw(2) << static_cast<unsigned>(b);
    }
    return oss.str();
}

inline std::string hmacSha256Hex(const std::string &key, const std::string &message)
{
    return toHex(hmacSha256(key, message));
}

/**
 * @brief Truncated hex HMAC used as a pseudonym code.
 * @param key The salt.
 * @param message The cache key of the identifier. Must not be empty.
 * @param length Requested code length; raised to kMinCodeLength, capped at 64.
 * @throw std::invalid_argument if message is empty. Callers must filter empty
 *        identifier text before it reaches this point.
 */
inline std::string hmacCode(const std::string &key, const std::string &message, std::size_t length)
{
    if (message.empty()) {
        throw std::invalid_argument("hashing::hmacCode: cannot hash empty text.");
    }
    std::size_t actual = length < kMinCodeLength ? kMinCodeLength : length;
    std::string hex = hmacSha256Hex(key, message);
    if (actual > hex.size()) {
        actual = hex.size();
    }
    return hex.substr(0, actual);
}

/**
 * @brief First four digest bytes as a big-endian unsigned integer.
 */
inline uint32_t leadingWord(const Digest &digest)
{
    return (static_cast<uint32_t>(digest[0]) << 24) |
           (static_cast<uint32_t>(digest[1]) << 16) |
           (static_cast<uint32_t>(digest[2]) << 8) |
           static_cast<uint32_t>(digest[3]);
}

} // namespace hashing
} // namespace util
} // namespace phiguard

#endif // PHIGUARD_UTIL_HASHING_HPP
