/**
 * @file credential_utils.hpp
 * @brief Credential hashing, random identifiers and constant-time comparison
 *
 * Thin wrappers around OpenSSL primitives:
 * - PBKDF2-HMAC-SHA256 for stored credentials
 * - RAND_bytes for session tokens and identifiers
 * - SHA-256 for storing session tokens at rest
 * - CRYPTO_memcmp for comparisons that must not leak timing
 * - EVP_EncodeBlock / EVP_DecodeBlock for base64 of binary payloads
 *
 * Encoded credential format:
 * ```
 * pbkdf2_sha256$<iterations>$<salt hex>$<derived key hex>
 * ```
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sentrybox {
namespace security {

class CredentialUtils {
public:
    static constexpr std::size_t kSaltBytes = 16;
    static constexpr std::size_t kDerivedKeyBytes = 32;
    static constexpr int kDefaultIterations = 100000;

    /**
     * @brief Hash a credential with a fresh random salt
     * @throws std::runtime_error if OpenSSL fails
     */
    static std::string HashPassword(const std::string& password,
                                    int iterations = kDefaultIterations);

    /**
     * @brief Verify a credential against an encoded hash
     *
     * Malformed encodings verify as false. The derivation always runs, so
     * timing does not depend on which part of the input was wrong.
     */
    static bool VerifyPassword(const std::string& password, const std::string& encoded);

    /**
     * @brief Encoded hash of a random secret, used to equalize timing for
     *        unknown principals
     */
    static const std::string& DummyHash(int iterations);

    /**
     * @brief Hex string of @p bytes cryptographically random bytes
     * @throws std::runtime_error if the RNG fails
     */
    static std::string RandomHex(std::size_t bytes);

    /// 32 hex chars (128 bits)
    static std::string GenerateId() { return RandomHex(16); }

    /// 64 hex chars (256 bits)
    static std::string GenerateSessionToken() { return RandomHex(32); }

    static std::string SHA256Hex(const std::string& data);

    static bool ConstantTimeEquals(const std::string& a, const std::string& b);

    static std::string Base64Encode(const std::string& data);

    /**
     * @brief Decode standard padded base64
     * @throws std::invalid_argument on malformed input
     */
    static std::string Base64Decode(const std::string& encoded);

    static std::vector<std::uint8_t> HexToBytes(const std::string& hex);
    static bool IsValidHex(const std::string& str);
};

} // namespace security
} // namespace sentrybox
