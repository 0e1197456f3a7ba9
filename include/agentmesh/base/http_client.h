#ifndef AGENTMESH_BASE_HTTP_CLIENT_H
#define AGENTMESH_BASE_HTTP_CLIENT_H

#include "agentmesh/base/error_code.h"
#include <cstdint>
#include <optional>
#include <string>

namespace agentmesh {

struct ParsedUrl {
    std::string host;
    uint16_t port = 80;
    std::string path = "/";  // includes the query string, if any
};

// Accepts http://host[:port][/path]; https is rejected
std::optional<ParsedUrl> parse_url(const std::string& url);

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string url_encode(const std::string& value);

struct HttpResponse {
    int status = 0;                       // 0 when the request never completed
    std::string body;
    ErrorCode error = ErrorCode::Success;
    std::string error_message;

    bool ok() const { return error == ErrorCode::Success && status >= 200 && status < 300; }
    bool transport_failed() const { return error != ErrorCode::Success; }
};

// Simple synchronous HTTP/1.1 client using POSIX sockets.
// One connection per request, "Connection: close". Reading stops once the
// framed response is in, so servers that keep the socket open still work.
class HttpClient {
public:
    static HttpResponse request(
        const std::string& method,
        const std::string& host,
        uint16_t port,
        const std::string& path,
        uint32_t timeout_sec,
        const std::string& body = "");
};

} // namespace agentmesh

#endif // AGENTMESH_BASE_HTTP_CLIENT_H
