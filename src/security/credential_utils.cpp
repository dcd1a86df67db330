/**
 * @file credential_utils.cpp
 * @brief OpenSSL-backed credential helpers
 *
 * @date 2025
 */

#include "sentrybox/security/credential_utils.hpp"
#include "sentrybox/utils/string_utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cctype>
#include <map>
#include <mutex>
#include <stdexcept>

namespace sentrybox {
namespace security {

namespace {

const char* kScheme = "pbkdf2_sha256";

std::vector<std::uint8_t> DeriveKey(const std::string& password,
                                    const std::vector<std::uint8_t>& salt,
                                    int iterations) {
    std::vector<std::uint8_t> key(CredentialUtils::kDerivedKeyBytes);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        throw std::runtime_error("PBKDF2 derivation failed");
    }
    return key;
}

} // namespace

// ============================================================================
// CREDENTIAL HASHING
// ============================================================================

std::string CredentialUtils::HashPassword(const std::string& password, int iterations) {
    if (iterations <= 0) {
        throw std::invalid_argument("PBKDF2 iteration count must be positive");
    }
    std::vector<std::uint8_t> salt(kSaltBytes);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    auto key = DeriveKey(password, salt, iterations);

    return std::string(kScheme) + "$" + std::to_string(iterations) + "$" +
           utils::StringUtils::ToHex(salt.data(), salt.size()) + "$" +
           utils::StringUtils::ToHex(key.data(), key.size());
}

bool CredentialUtils::VerifyPassword(const std::string& password, const std::string& encoded) {
    auto parts = utils::StringUtils::Split(encoded, '$');
    if (parts.size() != 4 || parts[0] != kScheme || !IsValidHex(parts[2]) ||
        !IsValidHex(parts[3])) {
        return false;
    }

    int iterations = 0;
    try {
        iterations = std::stoi(parts[1]);
    } catch (const std::exception&) {
        return false;
    }
    if (iterations <= 0) {
        return false;
    }

    auto salt = HexToBytes(parts[2]);
    auto expected = HexToBytes(parts[3]);
    auto actual = DeriveKey(password, salt, iterations);
    return expected.size() == actual.size() &&
           CRYPTO_memcmp(expected.data(), actual.data(), actual.size()) == 0;
}

const std::string& CredentialUtils::DummyHash(int iterations) {
    static std::mutex mutex;
    static std::map<int, std::string> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(iterations);
    if (it == cache.end()) {
        it = cache.emplace(iterations, HashPassword(RandomHex(16), iterations)).first;
    }
    return it->second;
}

// ============================================================================
// RANDOMNESS AND DIGESTS
// ============================================================================

std::string CredentialUtils::RandomHex(std::size_t bytes) {
    std::vector<std::uint8_t> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return utils::StringUtils::ToHex(buffer.data(), buffer.size());
}

std::string CredentialUtils::SHA256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return utils::StringUtils::ToHex(hash, SHA256_DIGEST_LENGTH);
}

bool CredentialUtils::ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// BASE64
// ============================================================================

std::string CredentialUtils::Base64Encode(const std::string& data) {
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

std::string CredentialUtils::Base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return "";
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("base64 length is not a multiple of 4");
    }
    std::string decoded(encoded.size() / 4 * 3, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&decoded[0]),
                                        reinterpret_cast<const unsigned char*>(encoded.data()),
                                        static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("malformed base64");
    }
    // EVP_DecodeBlock counts the zero bytes standing in for '=' padding
    std::size_t padding = 0;
    if (encoded.back() == '=') ++padding;
    if (encoded.size() > 1 && encoded[encoded.size() - 2] == '=') ++padding;
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

// ============================================================================
// HEX HELPERS
// ============================================================================

std::vector<std::uint8_t> CredentialUtils::HexToBytes(const std::string& hex) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        bytes.push_back(static_cast<std::uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

bool CredentialUtils::IsValidHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace security
} // namespace sentrybox
