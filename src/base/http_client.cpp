#include "agentmesh/base/http_client.h"
#include "agentmesh/base/logger.h"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

// Socket includes
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netdb.h>
#include <unistd.h>

namespace agentmesh {

namespace {

HttpResponse failure(ErrorCode code, const std::string& message) {
    HttpResponse response;
    response.error = code;
    response.error_message = message;
    return response;
}

// Closes the socket on every return path
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) close(fd_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool decode_chunked(const std::string& raw, std::string& out) {
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t line_end = raw.find("\r\n", pos);
        if (line_end == std::string::npos) return false;

        size_t chunk_size = 0;
        try {
            chunk_size = std::stoul(raw.substr(pos, line_end - pos), nullptr, 16);
        } catch (const std::exception&) {
            return false;
        }
        if (chunk_size == 0) return true;

        pos = line_end + 2;
        if (pos + chunk_size > raw.size()) return false;
        out.append(raw, pos, chunk_size);
        pos += chunk_size + 2;
    }
    return false;
}

// True once headers plus Content-Length bytes, or the final chunk, have arrived.
// Responses without framing are only complete at EOF.
bool response_complete(const std::string& raw) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) return false;

    std::string headers = to_lower(raw.substr(0, header_end + 2));
    size_t body_size = raw.size() - (header_end + 4);

    if (headers.find("transfer-encoding: chunked") != std::string::npos) {
        std::string decoded;
        return decode_chunked(raw.substr(header_end + 4), decoded);
    }

    size_t cl = headers.find("\r\ncontent-length:");
    if (cl == std::string::npos) return false;
    size_t value_start = cl + std::strlen("\r\ncontent-length:");
    size_t value_end = headers.find("\r\n", value_start);
    try {
        size_t length = std::stoul(headers.substr(value_start, value_end - value_start));
        return body_size >= length;
    } catch (const std::exception&) {
        return false;
    }
}

} // anonymous namespace

std::optional<ParsedUrl> parse_url(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        parsed.path = rest.substr(slash);
    }

    // Drop userinfo if present
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string port_str = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port_str.empty()) return std::nullopt;
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        unsigned long port = std::stoul(port_str);
        if (port == 0 || port > 65535) return std::nullopt;
        parsed.port = static_cast<uint16_t>(port);
    }

    if (authority.empty()) return std::nullopt;
    parsed.host = authority;
    return parsed;
}

std::string url_encode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%';
            encoded.width(2);
            encoded << static_cast<int>(c);
        }
    }
    return encoded.str();
}

HttpResponse HttpClient::request(
    const std::string& method,
    const std::string& host,
    uint16_t port,
    const std::string& path,
    uint32_t timeout_sec,
    const std::string& body) {

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        return failure(ErrorCode::ConnectionFailed, "failed to resolve host " + host + ": " + gai_strerror(rc));
    }

    struct timeval timeout;
    timeout.tv_sec = timeout_sec;
    timeout.tv_usec = 0;

    int fd = -1;
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        close(fd);
        fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        return failure(ErrorCode::ConnectionFailed, "failed to connect to " + host + ":" + port_str);
    }
    SocketGuard sock(fd);

    // Build HTTP request
    std::ostringstream request;
    request << method << " " << (path.empty() ? "/" : path) << " HTTP/1.1\r\n";
    request << "Host: " << host << ":" << port << "\r\n";
    request << "Accept: application/json\r\n";

    if (!body.empty() || method == "POST" || method == "PUT") {
        request << "Content-Type: application/json\r\n";
        request << "Content-Length: " << body.size() << "\r\n";
    }

    request << "Connection: close\r\n";
    request << "\r\n";
    request << body;

    std::string request_str = request.str();
    size_t total_sent = 0;
    while (total_sent < request_str.size()) {
        ssize_t sent = send(sock.get(), request_str.data() + total_sent,
                            request_str.size() - total_sent, MSG_NOSIGNAL);
        if (sent <= 0) {
            bool timed_out = (errno == EAGAIN || errno == EWOULDBLOCK);
            return failure(timed_out ? ErrorCode::Timeout : ErrorCode::SendFailed,
                           "failed to send request to " + host);
        }
        total_sent += static_cast<size_t>(sent);
    }

    // Read until EOF or until the framed response is complete
    std::string raw;
    char buffer[4096];
    while (!response_complete(raw)) {
        ssize_t n = recv(sock.get(), buffer, sizeof(buffer), 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            bool timed_out = (errno == EAGAIN || errno == EWOULDBLOCK);
            return failure(timed_out ? ErrorCode::Timeout : ErrorCode::ReceiveFailed,
                           "failed to read response from " + host);
        }
        raw.append(buffer, static_cast<size_t>(n));
    }

    // Parse HTTP response
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return failure(ErrorCode::InvalidResponse, "incomplete response from " + host);
    }

    HttpResponse response;
    std::string status_line = raw.substr(0, raw.find("\r\n"));
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos) {
        return failure(ErrorCode::InvalidResponse, "bad status line: " + status_line);
    }
    try {
        response.status = std::stoi(status_line.substr(sp + 1, 3));
    } catch (const std::exception&) {
        return failure(ErrorCode::InvalidResponse, "bad status line: " + status_line);
    }

    std::string header_block = to_lower(raw.substr(0, header_end));
    std::string payload = raw.substr(header_end + 4);
    if (header_block.find("transfer-encoding: chunked") != std::string::npos) {
        if (!decode_chunked(payload, response.body)) {
            return failure(ErrorCode::InvalidResponse, "malformed chunked body from " + host);
        }
    } else {
        response.body = std::move(payload);
    }

    Logger::instance().debug("{} {}:{}{} -> {}", method, host, port, path, response.status);
    return response;
}

} // namespace agentmesh
