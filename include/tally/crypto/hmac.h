// TALLY - HMAC (Hash-based Message Authentication Code)
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// HMAC-SHA256 (RFC 2104) backed by OpenSSL, plus the constant-time
// comparison and random helpers used by the access gate.

#ifndef TALLY_CRYPTO_HMAC_H
#define TALLY_CRYPTO_HMAC_H

#include "tally/core/types.h"

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tally {
namespace crypto {

/// 32-byte MAC
using Mac256 = std::array<Byte, 32>;

// ============================================================================
// HMAC-SHA256
// ============================================================================

/**
 * Incremental HMAC-SHA256.
 *
 * @throws std::runtime_error if the OpenSSL context cannot be created
 */
class HMAC_SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    HMAC_SHA256(const Byte* key, size_t keyLen);

    explicit HMAC_SHA256(const std::string& key)
        : HMAC_SHA256(reinterpret_cast<const Byte*>(key.data()), key.size()) {}

    ~HMAC_SHA256();

    /// Non-copyable (contains key material)
    HMAC_SHA256(const HMAC_SHA256&) = delete;
    HMAC_SHA256& operator=(const HMAC_SHA256&) = delete;

    HMAC_SHA256(HMAC_SHA256&& other) noexcept;
    HMAC_SHA256& operator=(HMAC_SHA256&& other) noexcept;

    HMAC_SHA256& Write(const Byte* data, size_t len);

    HMAC_SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    Mac256 Finalize();

    /// Reset to initial state (allows reuse with same key)
    HMAC_SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// One-shot HMAC-SHA256
Mac256 HmacSha256(const std::string& key, const std::string& data);

// ============================================================================
// Helpers
// ============================================================================

/// Constant-time equality (length mismatch returns false)
bool ConstantTimeEqual(const Byte* a, size_t aLen, const Byte* b, size_t bLen);

inline bool ConstantTimeEqual(const std::string& a, const std::string& b) {
    return ConstantTimeEqual(reinterpret_cast<const Byte*>(a.data()), a.size(),
                             reinterpret_cast<const Byte*>(b.data()), b.size());
}

/**
 * Cryptographically secure random bytes as lowercase hex.
 *
 * @throws std::runtime_error if the OpenSSL generator fails
 */
std::string GenerateSecureHex(size_t bytes);

} // namespace crypto
} // namespace tally

#endif // TALLY_CRYPTO_HMAC_H
