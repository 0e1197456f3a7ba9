#ifndef AGENTMESH_DISCOVERY_AGENT_RECORD_H
#define AGENTMESH_DISCOVERY_AGENT_RECORD_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentmesh {

// How a record was learned
enum class Provenance {
    Unknown,
    Registry,
    Dns,
    Gossip
};

std::string to_string(Provenance source);

// Immutable-by-replacement description of one agent.
// Updates build a new record; nothing patches a stored record in place.
struct AgentRecord {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> capabilities;
    std::map<std::string, std::string> interfaces;   // protocol -> URL
    std::map<std::string, std::string> endpoints;    // logical name -> path
    std::string host;
    std::string port;                                // raw advertised value
    std::string version;
    std::vector<std::string> protocols;
    std::string provider;
    std::string owner;
    double last_update = 0.0;                        // seconds since epoch

    Provenance source = Provenance::Unknown;
    uint64_t cache_time_ms = 0;

    // Placeholder bookkeeping for ids learned through gossip
    bool needs_resolution = false;
    std::string discovered_via;

    bool has_capability(const std::string& capability) const;

    bool operator==(const AgentRecord&) const = default;
};

// Builds the minimal record inserted for a gossiped id that could not be resolved
AgentRecord make_placeholder(const std::string& id, const std::string& discovered_via);

nlohmann::json agent_to_json(const AgentRecord& record);

// Returns nullopt when the document is not an object or carries no id
std::optional<AgentRecord> agent_from_json(const nlohmann::json& doc);

// Directory search filter. Every set field must match.
struct SearchCriteria {
    std::vector<std::string> capabilities;  // all required
    std::string query;                      // case-insensitive substring of name or description
    std::string protocol;
    std::string provider;
    std::optional<uint32_t> limit;          // passed to the directory only when set
    std::optional<uint32_t> offset;

    bool matches(const AgentRecord& record) const;
};

} // namespace agentmesh

#endif // AGENTMESH_DISCOVERY_AGENT_RECORD_H
