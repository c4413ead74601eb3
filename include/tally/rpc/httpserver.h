// TALLY - HTTP Server
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Blocking socket server: one accept thread hands each connection to a
// worker pool, which reads a single request, calls the handler and
// closes the connection.

#ifndef TALLY_RPC_HTTPSERVER_H
#define TALLY_RPC_HTTPSERVER_H

#include "tally/rpc/http.h"
#include "tally/util/threadpool.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tally {
namespace rpc {

/// Default listening port of tallyd
constexpr uint16_t DEFAULT_HTTP_PORT = 8640;

struct HttpServerConfig {
    /// Bind address
    std::string bindAddress{"127.0.0.1"};

    uint16_t port{DEFAULT_HTTP_PORT};

    /// Listen backlog and pending-connection limit
    size_t maxConnections{128};

    /// Socket receive timeout (seconds)
    int requestTimeout{30};

    /// Worker threads
    size_t threadPoolSize{4};

    /// Max request size including headers (bytes)
    size_t maxRequestSize{1024 * 1024};
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

class HttpServer {
public:
    HttpServer(const HttpServerConfig& config, HttpHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start the accept thread. Returns false on socket errors.
    bool Start();

    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// Block until the accept thread exits
    void Wait();

    /// Port actually bound (differs from the config when it asked for 0)
    uint16_t BoundPort() const { return boundPort_; }

    uint64_t GetTotalRequests() const { return totalRequests_.load(); }

private:
    void HTTPServerThread();
    void HandleConnection(int clientSocket);

    /// Read until the headers and Content-Length bytes of body have arrived
    bool ReadRequest(int clientSocket, std::string& raw, int& errorStatus);

    void SendResponse(int clientSocket, const HttpResponse& response);

    HttpServerConfig config_;
    HttpHandler handler_;

    int serverSocket_{-1};
    uint16_t boundPort_{0};
    std::atomic<bool> running_{false};
    std::thread httpThread_;
    std::unique_ptr<util::ThreadPool> threadPool_;

    std::atomic<uint64_t> totalRequests_{0};
};

} // namespace rpc
} // namespace tally

#endif // TALLY_RPC_HTTPSERVER_H
