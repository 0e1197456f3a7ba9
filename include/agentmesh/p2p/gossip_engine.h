#ifndef AGENTMESH_P2P_GOSSIP_ENGINE_H
#define AGENTMESH_P2P_GOSSIP_ENGINE_H

#include "agentmesh/base/clock.h"
#include "agentmesh/base/config.h"
#include "agentmesh/base/error_code.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentmesh {

class PeerTable;
class PeerTransport;
class DiscoveryCache;

struct GossipStats {
    uint64_t rounds_initiated = 0;
    uint64_t rounds_completed = 0;
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint64_t peers_sent = 0;
    uint64_t peers_received = 0;
    uint64_t new_peers_discovered = 0;
    uint64_t stale_peers_removed = 0;
    uint64_t errors = 0;
    double last_gossip_time = 0.0;   // seconds since epoch, 0 if no round ran
};

nlohmann::json stats_to_json(const GossipStats& stats);

struct ExchangeResult {
    std::string peer_id;
    bool success = false;
    ErrorCode error = ErrorCode::Success;
    std::string error_message;
    size_t sent_peers = 0;
    size_t received_peers = 0;
    std::vector<std::string> new_peers;
};

enum class RoundStatus {
    NoPeers,
    Completed
};

struct RoundResult {
    RoundStatus status = RoundStatus::NoPeers;
    std::vector<std::string> targets;
    std::vector<ExchangeResult> results;
    std::vector<std::string> stale_removed;
    uint64_t duration_ms = 0;
};

struct InboundResult {
    std::vector<std::string> added_peers;
    size_t total_peers = 0;
};

// Drives periodic gossip rounds and owns all peer-list merge logic,
// for outbound exchanges and inbound pushes alike.
class GossipEngine {
public:
    GossipEngine(const GossipConfig& gossip_config,
                 const PeerConfig& peer_config,
                 std::shared_ptr<PeerTable> peers,
                 std::shared_ptr<DiscoveryCache> discovery,
                 std::shared_ptr<PeerTransport> transport,
                 ClockFn clock = system_clock_fn());
    ~GossipEngine();

    // Start the background loop; false if already running
    bool start();

    // Stop the loop, honored within about one second; false if not running
    bool stop();

    bool is_running() const;

    // One full round: evict, select, exchange, mark healthy
    RoundResult run_round();

    // Usable peers first, padded from the rest of the table up to fanout
    std::vector<std::string> select_targets();

    // Our peer ids for a push, excluding target and self, capped per message
    std::vector<std::string> select_peers_to_send(const std::string& target);

    ExchangeResult exchange_with(const std::string& peer_id);

    // Folds ids pushed to us by another node
    InboundResult receive_peers(const std::vector<std::string>& peer_ids,
                                const std::string& source);

    GossipStats stats() const;

    // Deterministic sampling for tests
    void seed(uint32_t value);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agentmesh

#endif // AGENTMESH_P2P_GOSSIP_ENGINE_H
