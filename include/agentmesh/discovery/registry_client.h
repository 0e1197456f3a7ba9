#ifndef AGENTMESH_DISCOVERY_REGISTRY_CLIENT_H
#define AGENTMESH_DISCOVERY_REGISTRY_CLIENT_H

#include "agentmesh/base/config.h"
#include "agentmesh/discovery/agent_record.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentmesh {

enum class HeartbeatStatus {
    Ok,
    NotFound,
    Error
};

// Query parameters accepted by GET /agents. Empty fields are not sent.
struct AgentQuery {
    std::string capability;
    std::string query;
    std::string protocol;
    std::string provider;
    std::optional<uint32_t> limit;
    std::optional<uint32_t> offset;
};

// Contract to the central directory service.
// Lookups throw AgentMeshError on transport or server failure;
// get_agent returns nullopt only for an explicit 404.
class RegistryLink {
public:
    virtual ~RegistryLink() = default;

    virtual bool register_agent(const AgentRecord& record) = 0;
    virtual std::optional<AgentRecord> get_agent(const std::string& id) = 0;
    virtual std::vector<AgentRecord> list_agents(const AgentQuery& query) = 0;
    virtual HeartbeatStatus heartbeat(const std::string& id) = 0;
    virtual bool unregister_agent(const std::string& id) = 0;
};

// HTTP implementation talking JSON to the directory
class RegistryClient : public RegistryLink {
public:
    explicit RegistryClient(const RegistryConfig& config);
    ~RegistryClient() override;

    bool register_agent(const AgentRecord& record) override;
    std::optional<AgentRecord> get_agent(const std::string& id) override;
    std::vector<AgentRecord> list_agents(const AgentQuery& query) override;
    HeartbeatStatus heartbeat(const std::string& id) override;
    bool unregister_agent(const std::string& id) override;

    const std::string& base_url() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Renders the query string (including the leading '?') for GET /agents
std::string build_agents_query(const AgentQuery& query);

} // namespace agentmesh

#endif // AGENTMESH_DISCOVERY_REGISTRY_CLIENT_H
