// TALLY - HTTP Client
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// One-request-per-connection client used by tally-cli and the server tests.

#ifndef TALLY_RPC_HTTPCLIENT_H
#define TALLY_RPC_HTTPCLIENT_H

#include "tally/rpc/http.h"
#include "tally/rpc/httpserver.h"

#include <cstdint>
#include <string>

namespace tally {
namespace rpc {

struct HttpClientConfig {
    /// Server hostname or IP
    std::string host{"127.0.0.1"};

    uint16_t port{DEFAULT_HTTP_PORT};

    /// Connect, send and receive timeout (seconds)
    int timeout{30};

    /// Sent as "Authorization: Bearer <token>" when non-empty
    std::string bearerToken;
};

class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config);

    /**
     * Send one request and wait for the full response.
     * @throws std::runtime_error if the server cannot be reached or the
     *         response is malformed
     */
    HttpResponse Request(const std::string& method, const std::string& target,
                         const std::string& body = "");

    const HttpClientConfig& GetConfig() const { return config_; }

private:
    int Connect();
    std::string BuildHTTPRequest(const std::string& method, const std::string& target,
                                 const std::string& body) const;

    HttpClientConfig config_;
};

} // namespace rpc
} // namespace tally

#endif // TALLY_RPC_HTTPCLIENT_H
