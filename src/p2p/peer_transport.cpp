#include "agentmesh/p2p/peer_transport.h"
#include "agentmesh/base/error_code.h"
#include "agentmesh/base/http_client.h"
#include "agentmesh/base/logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace agentmesh {

namespace {

json parse_body(const HttpResponse& response, const PeerAddress& address, const char* what) {
    if (response.transport_failed()) {
        throw AgentMeshError(ErrorCode::PeerUnreachable,
                             std::string(what) + " " + address.to_string() + ": " + response.error_message);
    }
    if (!response.ok()) {
        throw AgentMeshError(ErrorCode::ExchangeFailed,
                             std::string(what) + " " + address.to_string() + ": HTTP " +
                             std::to_string(response.status));
    }
    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        throw AgentMeshError(ErrorCode::InvalidResponse,
                             std::string(what) + " " + address.to_string() + ": " + e.what());
    }
}

std::vector<std::string> string_array(const json& doc, const char* key) {
    std::vector<std::string> out;
    if (!doc.is_object()) return out;
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

} // anonymous namespace

HttpPeerTransport::HttpPeerTransport(uint32_t exchange_timeout_sec, uint32_t health_timeout_sec)
    : exchange_timeout_sec_(exchange_timeout_sec), health_timeout_sec_(health_timeout_sec) {}

std::vector<std::string> HttpPeerTransport::fetch_peers(const PeerAddress& address) {
    auto response = HttpClient::request("GET", address.host, address.port, "/peers",
                                        exchange_timeout_sec_);
    json doc = parse_body(response, address, "fetch peers from");
    return string_array(doc, "peers");
}

PushResult HttpPeerTransport::push_peers(const PeerAddress& address,
                                         const std::vector<std::string>& peer_ids) {
    json payload = {{"peers", peer_ids}};
    auto response = HttpClient::request("POST", address.host, address.port, "/peers",
                                        exchange_timeout_sec_, payload.dump());
    json doc = parse_body(response, address, "push peers to");

    PushResult result;
    result.added_peers = string_array(doc, "added_peers");
    if (doc.is_object() && doc.contains("total_peers") && doc["total_peers"].is_number_unsigned()) {
        result.total_peers = doc["total_peers"].get<size_t>();
    }
    return result;
}

std::optional<int> HttpPeerTransport::check_health(const PeerAddress& address) {
    auto response = HttpClient::request("GET", address.host, address.port, "/health",
                                        health_timeout_sec_);
    if (response.transport_failed()) {
        Logger::instance().debug("Health check to {} failed: {}", address.to_string(), response.error_message);
        return std::nullopt;
    }
    return response.status;
}

} // namespace agentmesh
