// TALLY - Base64url Encoding
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// URL-safe base64 (RFC 4648 section 5) without padding, as used by the
// compact bearer token layout.

#ifndef TALLY_UTIL_BASE64_H
#define TALLY_UTIL_BASE64_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace util {

/// Encode bytes as unpadded base64url
std::string Base64UrlEncode(const uint8_t* data, size_t len);

inline std::string Base64UrlEncode(const std::vector<uint8_t>& data) {
    return Base64UrlEncode(data.data(), data.size());
}

inline std::string Base64UrlEncode(const std::string& data) {
    return Base64UrlEncode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

/**
 * Decode unpadded base64url. Returns nullopt on any character outside the
 * url-safe alphabet (including '=' padding) or an impossible length.
 */
std::optional<std::vector<uint8_t>> Base64UrlDecode(const std::string& input);

/// Decode into a byte string
std::optional<std::string> Base64UrlDecodeString(const std::string& input);

} // namespace util
} // namespace tally

#endif // TALLY_UTIL_BASE64_H
