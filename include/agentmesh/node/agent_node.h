#ifndef AGENTMESH_NODE_AGENT_NODE_H
#define AGENTMESH_NODE_AGENT_NODE_H

#include "agentmesh/base/clock.h"
#include "agentmesh/base/config.h"
#include "agentmesh/discovery/agent_record.h"
#include <memory>

namespace agentmesh {

class RegistryLink;
class DnsLink;
class PeerTransport;
class DiscoveryCache;
class PeerTable;
class GossipEngine;
class PeerServer;
class RegistrationManager;

// Collaborators the node would otherwise build from configuration
struct AgentNodeDeps {
    std::shared_ptr<RegistryLink> registry;
    std::shared_ptr<DnsLink> dns;
    std::shared_ptr<PeerTransport> transport;
    ClockFn clock;
    bool serve_http = true;
};

// Owns discovery, the peer table, gossip, registration and the peer server,
// and runs the heartbeat, refresh and gossip loops.
class AgentNode {
public:
    explicit AgentNode(const GlobalConfig& config, AgentNodeDeps deps = {});
    ~AgentNode();

    bool start();
    void stop();
    bool is_running() const;

    // The record this node registers and serves on /metadata
    AgentRecord self_record() const;

    // Pulls the full directory listing into the peer table
    size_t fetch_peers();

    // Looks up peers sharing each of our capabilities
    size_t refresh_peer_discovery();

    // fetch_peers() followed by refresh_peer_discovery()
    size_t refresh();

    DiscoveryCache& discovery();
    PeerTable& peers();
    GossipEngine& gossip();
    RegistrationManager& registration();
    PeerServer& server();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agentmesh

#endif // AGENTMESH_NODE_AGENT_NODE_H
