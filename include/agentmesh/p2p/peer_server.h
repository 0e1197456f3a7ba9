#ifndef AGENTMESH_P2P_PEER_SERVER_H
#define AGENTMESH_P2P_PEER_SERVER_H

#include "agentmesh/base/config.h"
#include "agentmesh/discovery/agent_record.h"
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace agentmesh {

class PeerTable;
class GossipEngine;

struct HandlerResult {
    int status = 200;
    nlohmann::json body;
};

// Serves the peer-to-peer contract (/peers, /health) plus /metadata and the
// gossip control routes. Route bodies live in the handle_* methods so they
// can be exercised without a socket.
class PeerServer {
public:
    PeerServer(const NodeConfig& config,
               std::shared_ptr<PeerTable> peers,
               std::shared_ptr<GossipEngine> gossip,
               std::function<AgentRecord()> metadata_provider);
    ~PeerServer();

    bool start();
    void stop();
    bool is_running() const;

    HandlerResult handle_get_peers() const;
    HandlerResult handle_post_peers(const std::string& body);
    HandlerResult handle_health() const;
    HandlerResult handle_metadata() const;
    HandlerResult handle_gossip_stats() const;
    HandlerResult handle_gossip_start();
    HandlerResult handle_gossip_stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agentmesh

#endif // AGENTMESH_P2P_PEER_SERVER_H
