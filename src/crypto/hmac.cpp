// TALLY - HMAC Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/crypto/hmac.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace tally {
namespace crypto {

// ============================================================================
// HMAC_SHA256 Implementation
// ============================================================================

struct HMAC_SHA256::Impl {
    HMAC_CTX* ctx{nullptr};

    Impl(const Byte* key, size_t keyLen) {
        ctx = HMAC_CTX_new();
        if (!ctx) {
            throw std::runtime_error("HMAC_CTX_new failed");
        }
        if (HMAC_Init_ex(ctx, key, static_cast<int>(keyLen), EVP_sha256(), nullptr) != 1) {
            HMAC_CTX_free(ctx);
            throw std::runtime_error("HMAC_Init_ex failed");
        }
    }

    ~Impl() {
        HMAC_CTX_free(ctx);
    }
};

HMAC_SHA256::HMAC_SHA256(const Byte* key, size_t keyLen)
    : impl_(std::make_unique<Impl>(key, keyLen)) {}

HMAC_SHA256::~HMAC_SHA256() = default;

HMAC_SHA256::HMAC_SHA256(HMAC_SHA256&& other) noexcept = default;
HMAC_SHA256& HMAC_SHA256::operator=(HMAC_SHA256&& other) noexcept = default;

HMAC_SHA256& HMAC_SHA256::Write(const Byte* data, size_t len) {
    if (HMAC_Update(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("HMAC_Update failed");
    }
    return *this;
}

Mac256 HMAC_SHA256::Finalize() {
    Mac256 mac{};
    unsigned int len = OUTPUT_SIZE;
    if (HMAC_Final(impl_->ctx, mac.data(), &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("HMAC_Final failed");
    }
    return mac;
}

HMAC_SHA256& HMAC_SHA256::Reset() {
    if (HMAC_Init_ex(impl_->ctx, nullptr, 0, nullptr, nullptr) != 1) {
        throw std::runtime_error("HMAC_Init_ex failed");
    }
    return *this;
}

Mac256 HmacSha256(const std::string& key, const std::string& data) {
    HMAC_SHA256 hmac(key);
    hmac.Write(data);
    return hmac.Finalize();
}

// ============================================================================
// Helpers
// ============================================================================

bool ConstantTimeEqual(const Byte* a, size_t aLen, const Byte* b, size_t bLen) {
    if (aLen != bLen) {
        return false;
    }
    return CRYPTO_memcmp(a, b, aLen) == 0;
}

std::string GenerateSecureHex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char byte : buffer) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace crypto
} // namespace tally
