#include "agentmesh/base/error_code.h"

namespace agentmesh {

namespace {

class AgentMeshCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "AgentMesh";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const AgentMeshCategory& get_category() {
    static AgentMeshCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::InvalidResponse: return "Invalid response";
        case ErrorCode::InvalidUrl: return "Invalid URL";
        case ErrorCode::RegistryError: return "Registry error";
        case ErrorCode::RegistrationFailed: return "Registration failed";
        case ErrorCode::DnsLookupFailed: return "DNS lookup failed";
        case ErrorCode::AgentNotFound: return "Agent not found";
        case ErrorCode::PeerUnreachable: return "Peer unreachable";
        case ErrorCode::InvalidPeerMetadata: return "Invalid peer metadata";
        case ErrorCode::ExchangeFailed: return "Peer exchange failed";
        default: return "Unknown error";
    }
}

AgentMeshError::AgentMeshError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* AgentMeshError::what() const noexcept {
    return message_.c_str();
}

} // namespace agentmesh
