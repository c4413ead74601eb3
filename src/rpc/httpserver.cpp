// TALLY - HTTP Server
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/rpc/httpserver.h"
#include "tally/util/logging.h"

#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#define INVALID_SOCKET_VALUE (-1)
#define CLOSE_SOCKET close

namespace tally {
namespace rpc {

namespace {

HttpResponse ErrorResponse(int status, const std::string& kind, const std::string& message) {
    HttpResponse response;
    response.status = status;
    response.body = "{\"error\":{\"kind\":\"" + kind + "\",\"message\":\"" + message + "\"}}";
    return response;
}

} // namespace

HttpServer::HttpServer(const HttpServerConfig& config, HttpHandler handler)
    : config_(config), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    Stop();
}

bool HttpServer::Start() {
    if (running_.load()) return true;

    serverSocket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (serverSocket_ == INVALID_SOCKET_VALUE) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to create socket";
        return false;
    }

    int opt = 1;
    setsockopt(serverSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);

    if (config_.bindAddress == "0.0.0.0" || config_.bindAddress.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, config_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR(util::LogCategory::HTTP) << "Invalid bind address " << config_.bindAddress;
        CLOSE_SOCKET(serverSocket_);
        serverSocket_ = INVALID_SOCKET_VALUE;
        return false;
    }

    if (bind(serverSocket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to bind to "
            << config_.bindAddress << ":" << config_.port;
        CLOSE_SOCKET(serverSocket_);
        serverSocket_ = INVALID_SOCKET_VALUE;
        return false;
    }

    if (listen(serverSocket_, static_cast<int>(config_.maxConnections)) < 0) {
        LOG_ERROR(util::LogCategory::HTTP) << "Failed to listen on socket";
        CLOSE_SOCKET(serverSocket_);
        serverSocket_ = INVALID_SOCKET_VALUE;
        return false;
    }

    struct sockaddr_in bound;
    socklen_t boundLen = sizeof(bound);
    if (getsockname(serverSocket_, reinterpret_cast<struct sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = config_.port;
    }

    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = config_.threadPoolSize > 0 ? config_.threadPoolSize : 4;
    poolConfig.maxQueueSize = config_.maxConnections;
    poolConfig.name = "http";
    poolConfig.startImmediately = true;
    threadPool_ = std::make_unique<util::ThreadPool>(poolConfig);

    running_.store(true);

    httpThread_ = std::thread(&HttpServer::HTTPServerThread, this);

    LOG_INFO(util::LogCategory::HTTP) << "HTTP server started on "
        << config_.bindAddress << ":" << boundPort_
        << " with " << poolConfig.numThreads << " worker threads";
    return true;
}

void HttpServer::Stop() {
    if (!running_.load()) return;

    running_.store(false);

    // Closing the listening socket interrupts accept()
    if (serverSocket_ != INVALID_SOCKET_VALUE) {
        shutdown(serverSocket_, SHUT_RDWR);
        CLOSE_SOCKET(serverSocket_);
        serverSocket_ = INVALID_SOCKET_VALUE;
    }

    if (httpThread_.joinable()) {
        httpThread_.join();
    }

    if (threadPool_) {
        threadPool_->Stop();
        threadPool_->Wait();
        threadPool_.reset();
    }

    LOG_INFO(util::LogCategory::HTTP) << "HTTP server stopped";
}

void HttpServer::Wait() {
    if (httpThread_.joinable()) {
        httpThread_.join();
    }
}

void HttpServer::HTTPServerThread() {
    while (running_.load()) {
        struct sockaddr_in clientAddr;
        socklen_t clientLen = sizeof(clientAddr);

        int clientSocket = accept(serverSocket_,
                                  reinterpret_cast<struct sockaddr*>(&clientAddr),
                                  &clientLen);
        if (clientSocket < 0) {
            if (running_.load()) {
                LOG_WARN(util::LogCategory::HTTP) << "Accept failed";
            }
            continue;
        }

        if (!threadPool_->TrySubmit([this, clientSocket]() { HandleConnection(clientSocket); })) {
            LOG_WARN(util::LogCategory::HTTP) << "Worker queue full, rejecting connection";
            SendResponse(clientSocket,
                         ErrorResponse(503, "TransientConflict", "server busy"));
            CLOSE_SOCKET(clientSocket);
        }
    }
}

bool HttpServer::ReadRequest(int clientSocket, std::string& raw, int& errorStatus) {
    char buffer[8192];
    size_t expectedTotal = 0;

    while (true) {
        ssize_t bytesRead = recv(clientSocket, buffer, sizeof(buffer), 0);
        if (bytesRead <= 0) {
            errorStatus = 0;
            return false;
        }
        raw.append(buffer, static_cast<size_t>(bytesRead));
        if (raw.size() > config_.maxRequestSize) {
            errorStatus = 413;
            return false;
        }

        if (expectedTotal == 0) {
            size_t headerEnd = FindHeaderEnd(raw);
            if (headerEnd == std::string::npos) continue;
            auto length = ParseContentLength(raw);
            if (!length) {
                errorStatus = 400;
                return false;
            }
            if (headerEnd + *length > config_.maxRequestSize) {
                errorStatus = 413;
                return false;
            }
            expectedTotal = headerEnd + *length;
        }
        if (raw.size() >= expectedTotal) {
            return true;
        }
    }
}

void HttpServer::SendResponse(int clientSocket, const HttpResponse& response) {
    std::string data = BuildHTTPResponse(response);
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(clientSocket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            LOG_DEBUG(util::LogCategory::HTTP) << "Client went away before the response was sent";
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

void HttpServer::HandleConnection(int clientSocket) {
    struct timeval tv;
    tv.tv_sec = config_.requestTimeout;
    tv.tv_usec = 0;
    setsockopt(clientSocket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string raw;
    int errorStatus = 0;
    HttpRequest request;
    if (!ReadRequest(clientSocket, raw, errorStatus)) {
        if (errorStatus != 0) {
            SendResponse(clientSocket, ErrorResponse(errorStatus, "ValidationError",
                                                     StatusText(errorStatus)));
        }
    } else if (!ParseHTTPRequest(raw, request)) {
        SendResponse(clientSocket,
                     ErrorResponse(400, "ValidationError", "malformed HTTP request"));
    } else {
        ++totalRequests_;
        HttpResponse response;
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::HTTP) << "Handler failed for " << request.method << " "
                                               << request.path << ": " << e.what();
            response = ErrorResponse(500, "StorageError", "internal error");
        }
        LOG_DEBUG(util::LogCategory::HTTP) << request.method << " " << request.path << " -> "
                                           << response.status;
        SendResponse(clientSocket, response);
    }

    CLOSE_SOCKET(clientSocket);
}

} // namespace rpc
} // namespace tally
