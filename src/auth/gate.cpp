// TALLY - Access Gate
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/auth/gate.h"
#include "tally/crypto/hmac.h"
#include "tally/ledger/errors.h"
#include "tally/util/base64.h"
#include "tally/util/json.h"
#include "tally/util/logging.h"

#include <cctype>
#include <stdexcept>
#include <vector>

namespace tally {
namespace auth {

using ledger::ErrorKind;
using ledger::LedgerError;

namespace {

const char* const TOKEN_HEADER = "{\"alg\":\"HS256\",\"typ\":\"JWT\"}";

std::vector<std::string> SplitToken(const std::string& token) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = token.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(token.substr(start));
            break;
        }
        parts.push_back(token.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

LedgerError Invalid(const std::string& why) {
    LOG_WARN(util::LogCategory::AUTH) << "Rejected token: " << why;
    return LedgerError(ErrorKind::InvalidToken, "invalid token: " + why);
}

util::JSONValue DecodeSegment(const std::string& segment, const char* what) {
    auto text = util::Base64UrlDecodeString(segment);
    if (!text) {
        throw Invalid(std::string(what) + " is not base64url");
    }
    auto json = util::JSONValue::TryParse(*text);
    if (!json || !json->IsObject()) {
        throw Invalid(std::string(what) + " is not a JSON object");
    }
    return *json;
}

} // namespace

AccessGate::AccessGate(std::string secret) : secret_(std::move(secret)) {
    if (secret_.size() < MIN_SECRET_LENGTH) {
        throw std::invalid_argument("token secret must be at least " +
                                    std::to_string(MIN_SECRET_LENGTH) + " characters");
    }
}

std::string AccessGate::Sign(const std::string& signingInput) const {
    crypto::Mac256 mac = crypto::HmacSha256(secret_, signingInput);
    return util::Base64UrlEncode(mac.data(), mac.size());
}

std::string AccessGate::IssueToken(const std::string& subject, const std::string& role,
                                   int64_t ttlSeconds) const {
    Timestamp now = GetTime();
    util::JSONValue payload(util::JSONValue::Object{});
    payload["sub"] = subject;
    payload["role"] = role;
    payload["iat"] = now;
    payload["exp"] = now + ttlSeconds;

    std::string signingInput = util::Base64UrlEncode(std::string(TOKEN_HEADER)) + "." +
                               util::Base64UrlEncode(payload.ToJSON());
    return signingInput + "." + Sign(signingInput);
}

Claims AccessGate::Verify(const std::string& token) const {
    std::vector<std::string> parts = SplitToken(token);
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        throw Invalid("expected three dot-separated segments");
    }

    auto signature = util::Base64UrlDecode(parts[2]);
    if (!signature) {
        throw Invalid("signature is not base64url");
    }
    crypto::Mac256 expected = crypto::HmacSha256(secret_, parts[0] + "." + parts[1]);
    if (!crypto::ConstantTimeEqual(expected.data(), expected.size(),
                                   signature->data(), signature->size())) {
        throw Invalid("signature mismatch");
    }

    util::JSONValue header = DecodeSegment(parts[0], "header");
    if (header["alg"].GetString() != "HS256") {
        throw Invalid("unsupported algorithm");
    }

    util::JSONValue payload = DecodeSegment(parts[1], "payload");
    const util::JSONValue& sub = payload["sub"];
    const util::JSONValue& role = payload["role"];
    const util::JSONValue& exp = payload["exp"];
    if (!sub.IsString() || sub.GetString().empty()) {
        throw Invalid("missing subject");
    }
    if (!role.IsString() || role.GetString().empty()) {
        throw Invalid("missing role");
    }
    if (!exp.IsInt()) {
        throw Invalid("missing expiry");
    }

    Claims claims;
    claims.subject = sub.GetString();
    claims.role = role.GetString();
    claims.expiresAt = exp.GetInt();
    claims.issuedAt = payload["iat"].GetInt(0);

    if (GetTime() >= claims.expiresAt) {
        LOG_DEBUG(util::LogCategory::AUTH) << "Expired token for " << claims.subject;
        throw LedgerError(ErrorKind::TokenExpired, "token expired");
    }
    return claims;
}

Claims AccessGate::Authorize(const std::string& token, const std::string& requiredRole) const {
    Claims claims = Verify(token);
    if (claims.role != requiredRole) {
        LOG_WARN(util::LogCategory::AUTH) << "User " << claims.subject << " with role "
                                          << claims.role << " attempted a " << requiredRole
                                          << " action";
        throw LedgerError(ErrorKind::InsufficientRole, requiredRole + " role required");
    }
    return claims;
}

std::optional<std::string> AccessGate::ParseBearer(const std::string& header) {
    const std::string scheme = "Bearer ";
    if (header.size() <= scheme.size()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) !=
            std::tolower(static_cast<unsigned char>(scheme[i]))) {
            return std::nullopt;
        }
    }
    size_t start = header.find_first_not_of(' ', scheme.size());
    if (start == std::string::npos) {
        return std::nullopt;
    }
    size_t end = header.find_last_not_of(" \t\r\n");
    return header.substr(start, end - start + 1);
}

} // namespace auth
} // namespace tally
