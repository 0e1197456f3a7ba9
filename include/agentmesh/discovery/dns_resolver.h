#ifndef AGENTMESH_DISCOVERY_DNS_RESOLVER_H
#define AGENTMESH_DISCOVERY_DNS_RESOLVER_H

#include "agentmesh/base/config.h"
#include "agentmesh/discovery/agent_record.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentmesh {

// Service label prefixed to the agent id for SRV and TXT lookups
inline constexpr const char* kAgentServiceLabel = "_llm-agent._tcp.";

// Contract to the name service used as a discovery fallback
class DnsLink {
public:
    virtual ~DnsLink() = default;

    // nullopt when no SRV record exists for the id
    virtual std::optional<AgentRecord> resolve_agent(const std::string& id) = 0;
};

// libresolv backed resolver that queries a configured name server
class DnsResolver : public DnsLink {
public:
    explicit DnsResolver(const DnsConfig& config);
    ~DnsResolver() override;

    std::optional<AgentRecord> resolve_agent(const std::string& id) override;

    // Nameserver actually queried, after resolving a host name to IPv4
    std::string nameserver() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Splits TXT rdata into its length-prefixed character strings
std::vector<std::string> split_txt_rdata(const unsigned char* rdata, size_t length);

// Builds a record from SRV target/port and TXT tokens (caps=, desc=, ver=)
AgentRecord build_dns_record(const std::string& id,
                             const std::string& host,
                             uint16_t port,
                             const std::vector<std::string>& txt_tokens);

} // namespace agentmesh

#endif // AGENTMESH_DISCOVERY_DNS_RESOLVER_H
