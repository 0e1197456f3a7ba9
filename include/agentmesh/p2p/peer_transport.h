#ifndef AGENTMESH_P2P_PEER_TRANSPORT_H
#define AGENTMESH_P2P_PEER_TRANSPORT_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentmesh {

// Normalized contact address of a peer. An empty host means unresolved.
struct PeerAddress {
    std::string host;
    uint16_t port = 0;

    bool resolved() const { return !host.empty() && port != 0; }
    std::string to_string() const { return host + ":" + std::to_string(port); }

    bool operator==(const PeerAddress&) const = default;
};

struct PushResult {
    std::vector<std::string> added_peers;
    size_t total_peers = 0;
};

// Consumed side of the peer-to-peer contract.
// fetch_peers and push_peers throw AgentMeshError on any failure.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    // GET /peers
    virtual std::vector<std::string> fetch_peers(const PeerAddress& address) = 0;

    // POST /peers {"peers": [...]}
    virtual PushResult push_peers(const PeerAddress& address,
                                  const std::vector<std::string>& peer_ids) = 0;

    // GET /health; nullopt if the request did not complete
    virtual std::optional<int> check_health(const PeerAddress& address) = 0;
};

class HttpPeerTransport : public PeerTransport {
public:
    HttpPeerTransport(uint32_t exchange_timeout_sec, uint32_t health_timeout_sec);

    std::vector<std::string> fetch_peers(const PeerAddress& address) override;
    PushResult push_peers(const PeerAddress& address,
                          const std::vector<std::string>& peer_ids) override;
    std::optional<int> check_health(const PeerAddress& address) override;

private:
    uint32_t exchange_timeout_sec_;
    uint32_t health_timeout_sec_;
};

} // namespace agentmesh

#endif // AGENTMESH_P2P_PEER_TRANSPORT_H
