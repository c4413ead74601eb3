// TALLY - HTTP Messages
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/rpc/http.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tally {
namespace rpc {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string Trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Parse "Name: value" lines after the start line
void ParseHeaderLines(std::istringstream& stream, std::map<std::string, std::string>& headers) {
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        size_t colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            headers[Lower(Trim(line.substr(0, colonPos)))] = Trim(line.substr(colonPos + 1));
        }
    }
}

} // namespace

std::string HttpRequest::Header(const std::string& name) const {
    auto it = headers.find(Lower(name));
    return it == headers.end() ? std::string() : it->second;
}

const char* StatusText(int statusCode) {
    switch (statusCode) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::optional<std::string> UrlDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= text.size()) {
                return std::nullopt;
            }
            int hi = HexValue(text[i + 1]);
            int lo = HexValue(text[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string UrlEncode(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

bool ParseQueryString(const std::string& query, std::map<std::string, std::string>& out) {
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(start, amp - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            auto key = UrlDecode(pair.substr(0, eq));
            auto value = UrlDecode(eq == std::string::npos ? "" : pair.substr(eq + 1));
            if (!key || !value) {
                return false;
            }
            out[*key] = *value;
        }
        start = amp + 1;
    }
    return true;
}

size_t FindHeaderEnd(const std::string& raw) {
    size_t pos = raw.find("\r\n\r\n");
    if (pos != std::string::npos) {
        return pos + 4;
    }
    pos = raw.find("\n\n");
    if (pos != std::string::npos) {
        return pos + 2;
    }
    return std::string::npos;
}

std::optional<size_t> ParseContentLength(const std::string& raw) {
    size_t headerEnd = FindHeaderEnd(raw);
    std::istringstream stream(raw.substr(0, headerEnd == std::string::npos ? raw.size()
                                                                             : headerEnd));
    std::string startLine;
    std::getline(stream, startLine);
    std::map<std::string, std::string> headers;
    ParseHeaderLines(stream, headers);

    auto it = headers.find("content-length");
    if (it == headers.end()) {
        return size_t{0};
    }
    const std::string& value = it->second;
    if (value.empty() || value.size() > 18 ||
        !std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::stoull(value));
}

bool ParseHTTPRequest(const std::string& raw, HttpRequest& request) {
    size_t headerEnd = FindHeaderEnd(raw);
    if (headerEnd == std::string::npos) return false;

    request.body = raw.substr(headerEnd);
    std::istringstream stream(raw.substr(0, headerEnd));

    // Request line: METHOD TARGET VERSION
    std::string line;
    if (!std::getline(stream, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream requestLine(line);
    std::string target, version;
    if (!(requestLine >> request.method >> target >> version)) return false;
    if (version.compare(0, 5, "HTTP/") != 0 || target.empty() || target[0] != '/') return false;

    size_t qmark = target.find('?');
    auto path = UrlDecode(target.substr(0, qmark));
    if (!path) return false;
    request.path = *path;
    request.query.clear();
    if (qmark != std::string::npos &&
        !ParseQueryString(target.substr(qmark + 1), request.query)) {
        return false;
    }

    request.headers.clear();
    ParseHeaderLines(stream, request.headers);

    auto it = request.headers.find("content-length");
    if (it != request.headers.end()) {
        auto length = ParseContentLength(raw);
        if (!length) return false;
        if (request.body.size() > *length) {
            request.body.resize(*length);
        }
    }
    return true;
}

std::string BuildHTTPResponse(const HttpResponse& response) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << response.status << " " << StatusText(response.status) << "\r\n";
    ss << "Content-Type: " << response.contentType << "\r\n";
    ss << "Content-Length: " << response.body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << response.body;
    return ss.str();
}

bool ParseHTTPResponse(const std::string& raw, HttpResponse& response) {
    size_t headerEnd = FindHeaderEnd(raw);
    if (headerEnd == std::string::npos) return false;

    std::istringstream stream(raw.substr(0, headerEnd));
    std::string line;
    if (!std::getline(stream, line)) return false;

    std::istringstream statusLine(line);
    std::string version;
    int status = 0;
    if (!(statusLine >> version >> status) || version.compare(0, 5, "HTTP/") != 0) return false;

    std::map<std::string, std::string> headers;
    ParseHeaderLines(stream, headers);

    response.status = status;
    response.body = raw.substr(headerEnd);
    auto type = headers.find("content-type");
    if (type != headers.end()) {
        response.contentType = type->second;
    }
    auto length = headers.find("content-length");
    if (length != headers.end()) {
        auto n = ParseContentLength(raw);
        if (!n) return false;
        if (response.body.size() > *n) response.body.resize(*n);
    }
    return true;
}

} // namespace rpc
} // namespace tally
