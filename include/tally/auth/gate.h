// TALLY - Access Gate
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Validates HS256-signed compact bearer tokens (JWT layout:
// base64url(header).base64url(payload).base64url(signature)) carrying
// `sub`, `role` and `exp` claims.

#ifndef TALLY_AUTH_GATE_H
#define TALLY_AUTH_GATE_H

#include "tally/core/types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tally {
namespace auth {

/// Minimum length of the shared signing secret
constexpr size_t MIN_SECRET_LENGTH = 32;

/// Default token lifetime in seconds
constexpr int64_t DEFAULT_TOKEN_TTL = 3600;

struct Claims {
    std::string subject;
    std::string role;
    Timestamp issuedAt{0};
    Timestamp expiresAt{0};
};

class AccessGate {
public:
    /// Throws std::invalid_argument if the secret is shorter than 32 characters
    explicit AccessGate(std::string secret);

    /// Sign a token for the subject and role valid for ttlSeconds from now
    std::string IssueToken(const std::string& subject, const std::string& role,
                           int64_t ttlSeconds = DEFAULT_TOKEN_TTL) const;

    /**
     * Check signature and claims.
     * Throws LedgerError(InvalidToken) for a malformed token, a bad
     * signature or missing claims, LedgerError(TokenExpired) past `exp`.
     */
    Claims Verify(const std::string& token) const;

    /// Verify, then require the role. Throws LedgerError(InsufficientRole).
    Claims Authorize(const std::string& token, const std::string& requiredRole) const;

    /// Token from an "Authorization: Bearer <token>" header value
    static std::optional<std::string> ParseBearer(const std::string& header);

private:
    std::string Sign(const std::string& signingInput) const;

    std::string secret_;
};

} // namespace auth
} // namespace tally

#endif // TALLY_AUTH_GATE_H
