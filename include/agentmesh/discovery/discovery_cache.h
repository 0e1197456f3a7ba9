#ifndef AGENTMESH_DISCOVERY_DISCOVERY_CACHE_H
#define AGENTMESH_DISCOVERY_DISCOVERY_CACHE_H

#include "agentmesh/base/clock.h"
#include "agentmesh/base/config.h"
#include "agentmesh/discovery/agent_record.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentmesh {

class RegistryLink;
class DnsLink;

enum class DiscoveryMethod {
    Registry,
    Dns
};

struct DiscoveryStats {
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    uint64_t registry_lookups = 0;
    uint64_t dns_lookups = 0;
    uint64_t failures = 0;
    size_t cached_entries = 0;
};

// Unifies the directory and the name service behind one lookup API with a
// time-bounded cache. Lookups never throw; failures degrade to "no result".
class DiscoveryCache {
public:
    // Either link may be null, in which case that method is skipped
    DiscoveryCache(const DiscoveryConfig& config,
                   std::shared_ptr<RegistryLink> registry,
                   std::shared_ptr<DnsLink> dns,
                   ClockFn clock = system_clock_fn());
    ~DiscoveryCache();

    std::optional<AgentRecord> resolve(const std::string& id);

    // Directory only; results are written through the cache
    std::vector<AgentRecord> resolve_by_capability(const std::string& capability);
    std::vector<AgentRecord> resolve_by_criteria(const SearchCriteria& criteria);

    // Full directory listing, written through the cache
    std::vector<AgentRecord> list_all();

    void invalidate(const std::string& id);
    void clear();

    // Re-resolves every cached id, ignoring freshness
    size_t refresh();

    std::optional<AgentRecord> peek(const std::string& id) const;
    size_t size() const;
    DiscoveryStats stats() const;

    const std::vector<DiscoveryMethod>& methods() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Maps configured method names onto the supported methods, dropping unknown names
std::vector<DiscoveryMethod> parse_discovery_methods(const std::vector<std::string>& names);

} // namespace agentmesh

#endif // AGENTMESH_DISCOVERY_DISCOVERY_CACHE_H
