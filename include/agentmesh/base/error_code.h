#ifndef AGENTMESH_BASE_ERROR_CODE_H
#define AGENTMESH_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace agentmesh {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    Timeout = 1004,
    InternalError = 1006,
    ConfigError = 1008,

    // Network errors (2000-2999)
    NetworkError = 2001,
    ConnectionFailed = 2002,
    ConnectionClosed = 2003,
    SendFailed = 2004,
    ReceiveFailed = 2005,
    InvalidResponse = 2006,
    InvalidUrl = 2007,

    // Discovery errors (3000-3999)
    RegistryError = 3001,
    RegistrationFailed = 3002,
    DnsLookupFailed = 3003,
    AgentNotFound = 3004,

    // Peer errors (4000-4999)
    PeerUnreachable = 4001,
    InvalidPeerMetadata = 4002,
    ExchangeFailed = 4003
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class AgentMeshError : public std::exception {
public:
    AgentMeshError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace agentmesh

namespace std {
template <>
struct is_error_code_enum<agentmesh::ErrorCode> : true_type {};
} // namespace std

#endif // AGENTMESH_BASE_ERROR_CODE_H
