#ifndef AGENTMESH_P2P_PEER_TABLE_H
#define AGENTMESH_P2P_PEER_TABLE_H

#include "agentmesh/base/clock.h"
#include "agentmesh/discovery/agent_record.h"
#include "agentmesh/p2p/peer_transport.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentmesh {

inline constexpr uint16_t kDefaultPeerPort = 8000;

enum class PeerHealth {
    Unknown,
    Healthy,
    Unhealthy
};

std::string to_string(PeerHealth health);

struct PeerEntry {
    std::string id;
    AgentRecord record;
    PeerHealth health = PeerHealth::Unknown;
    uint64_t last_seen_ms = 0;
    PeerAddress address;
};

// Which peers are worth contacting
struct UsablePeerPolicy {
    uint32_t recent_window_sec = 300;
    bool trust_unchecked = true;     // unknown health counts if seen within the window
    bool fallback_to_all = true;    // never return an empty set from a non-empty table

    bool usable(const PeerEntry& entry, uint64_t now_ms) const;
};

// Derives the contact address: explicit host/port fields, then the "rest"
// interface URL, then the id's leading label, then the default port.
PeerAddress resolve_peer_address(const std::string& id, const AgentRecord& record);

// Concurrent registry of known peers. A single mutex covers records, health
// and last-seen as one unit; reads return copies. Never holds the lock across
// a network call.
class PeerTable {
public:
    explicit PeerTable(std::string self_id,
                       std::shared_ptr<PeerTransport> transport = nullptr,
                       ClockFn clock = system_clock_fn());
    ~PeerTable();

    // Returns false for the local id; health is set to Unknown only on first insert
    bool upsert(const std::string& id, const AgentRecord& record);
    bool remove(const std::string& id);

    // Inserts only when the id is not yet known, checked and written under one lock.
    // Returns false for the local id and for ids that are already present.
    bool insert_if_absent(const std::string& id, const AgentRecord& record);

    std::optional<AgentRecord> get(const std::string& id) const;
    std::optional<PeerEntry> entry(const std::string& id) const;
    std::optional<PeerHealth> health(const std::string& id) const;
    std::vector<PeerEntry> all() const;
    std::vector<std::string> ids() const;
    bool contains(const std::string& id) const;
    size_t size() const;

    std::vector<PeerEntry> usable_peers() const;

    // Direct liveness check against the peer's /health endpoint
    PeerHealth check_health(const std::string& id);

    void update_health(const std::string& id, PeerHealth health);

    // Removes and returns every peer idle for more than ttl_sec
    std::vector<std::string> evict_stale(uint32_t ttl_sec);

    void set_policy(const UsablePeerPolicy& policy);
    UsablePeerPolicy policy() const;

    const std::string& self_id() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace agentmesh

#endif // AGENTMESH_P2P_PEER_TABLE_H
