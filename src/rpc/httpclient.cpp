// TALLY - HTTP Client
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/rpc/httpclient.h"

#include <cstring>
#include <sstream>
#include <stdexcept>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#define INVALID_SOCKET_VALUE (-1)
#define CLOSE_SOCKET close

namespace tally {
namespace rpc {

HttpClient::HttpClient(const HttpClientConfig& config) : config_(config) {}

int HttpClient::Connect() {
    struct addrinfo hints, *result;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(config_.port);
    if (getaddrinfo(config_.host.c_str(), portStr.c_str(), &hints, &result) != 0) {
        throw std::runtime_error("Failed to resolve host: " + config_.host);
    }

    int sock = INVALID_SOCKET_VALUE;
    for (struct addrinfo* p = result; p != nullptr; p = p->ai_next) {
        sock = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (sock == INVALID_SOCKET_VALUE) continue;

        struct timeval tv;
        tv.tv_sec = config_.timeout;
        tv.tv_usec = 0;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(sock, p->ai_addr, p->ai_addrlen) == 0) {
            freeaddrinfo(result);
            return sock;
        }

        CLOSE_SOCKET(sock);
        sock = INVALID_SOCKET_VALUE;
    }

    freeaddrinfo(result);
    throw std::runtime_error("Failed to connect to " + config_.host + ":" + portStr);
}

std::string HttpClient::BuildHTTPRequest(const std::string& method, const std::string& target,
                                         const std::string& body) const {
    std::ostringstream ss;
    ss << method << " " << target << " HTTP/1.1\r\n";
    ss << "Host: " << config_.host << ":" << config_.port << "\r\n";
    ss << "Content-Type: application/json\r\n";
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    if (!config_.bearerToken.empty()) {
        ss << "Authorization: Bearer " << config_.bearerToken << "\r\n";
    }
    ss << "\r\n";
    ss << body;
    return ss.str();
}

HttpResponse HttpClient::Request(const std::string& method, const std::string& target,
                                 const std::string& body) {
    int sock = Connect();
    std::string request = BuildHTTPRequest(method, target, body);

    size_t totalSent = 0;
    while (totalSent < request.size()) {
        ssize_t sent = send(sock, request.data() + totalSent, request.size() - totalSent,
                            MSG_NOSIGNAL);
        if (sent <= 0) {
            CLOSE_SOCKET(sock);
            throw std::runtime_error("Send failed");
        }
        totalSent += static_cast<size_t>(sent);
    }

    std::string raw;
    char buffer[4096];
    while (true) {
        ssize_t received = recv(sock, buffer, sizeof(buffer), 0);
        if (received < 0) {
            CLOSE_SOCKET(sock);
            throw std::runtime_error("Receive failed");
        }
        if (received == 0) break;
        raw.append(buffer, static_cast<size_t>(received));

        size_t headerEnd = FindHeaderEnd(raw);
        if (headerEnd != std::string::npos) {
            auto length = ParseContentLength(raw);
            if (length && raw.size() >= headerEnd + *length) break;
        }
    }
    CLOSE_SOCKET(sock);

    HttpResponse response;
    if (!ParseHTTPResponse(raw, response)) {
        throw std::runtime_error("Malformed response from " + config_.host);
    }
    return response;
}

} // namespace rpc
} // namespace tally
