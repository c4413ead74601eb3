// TALLY - HTTP Messages
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Minimal HTTP/1.1 request and response framing shared by the server and
// the command-line client. Connections carry one request each.

#ifndef TALLY_RPC_HTTP_H
#define TALLY_RPC_HTTP_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace tally {
namespace rpc {

struct HttpRequest {
    std::string method;
    /// Decoded path without the query string
    std::string path;
    std::map<std::string, std::string> query;
    /// Header names are lowercased
    std::map<std::string, std::string> headers;
    std::string body;

    /// Header value or empty
    std::string Header(const std::string& name) const;
};

struct HttpResponse {
    int status{200};
    std::string body;
    std::string contentType{"application/json"};
};

/// Reason phrase for a status code
const char* StatusText(int statusCode);

/// Percent-decoding; '+' becomes a space. Returns nullopt on a bad escape.
std::optional<std::string> UrlDecode(const std::string& text);

/// Percent-encode everything outside the unreserved set
std::string UrlEncode(const std::string& text);

/// Split "a=1&b=2" into decoded pairs; later keys overwrite earlier ones
bool ParseQueryString(const std::string& query, std::map<std::string, std::string>& out);

/**
 * Offset just past the blank line ending the header block, or npos if the
 * block is not complete yet.
 */
size_t FindHeaderEnd(const std::string& raw);

/// Content-Length of a raw header block, 0 if absent, nullopt if malformed
std::optional<size_t> ParseContentLength(const std::string& raw);

/// Parse a complete raw request (request line, headers, body)
bool ParseHTTPRequest(const std::string& raw, HttpRequest& request);

/// Serialize a response with Content-Length and "Connection: close"
std::string BuildHTTPResponse(const HttpResponse& response);

/// Parse a raw response into status and body
bool ParseHTTPResponse(const std::string& raw, HttpResponse& response);

} // namespace rpc
} // namespace tally

#endif // TALLY_RPC_HTTP_H
