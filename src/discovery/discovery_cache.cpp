#include "agentmesh/discovery/discovery_cache.h"
#include "agentmesh/discovery/dns_resolver.h"
#include "agentmesh/discovery/registry_client.h"
#include "agentmesh/base/logger.h"
#include <mutex>
#include <unordered_map>

namespace agentmesh {

std::vector<DiscoveryMethod> parse_discovery_methods(const std::vector<std::string>& names) {
    std::vector<DiscoveryMethod> methods;
    for (const auto& name : names) {
        DiscoveryMethod method;
        if (name == "registry") {
            method = DiscoveryMethod::Registry;
        } else if (name == "dns") {
            method = DiscoveryMethod::Dns;
        } else {
            // "peers" is handled by the gossip engine, not by lookups
            if (name != "peers") {
                Logger::instance().warning("Ignoring unknown discovery method: " + name);
            }
            continue;
        }
        bool seen = false;
        for (auto m : methods) seen = seen || (m == method);
        if (!seen) methods.push_back(method);
    }
    return methods;
}

struct DiscoveryCache::Impl {
    DiscoveryConfig config;
    std::shared_ptr<RegistryLink> registry;
    std::shared_ptr<DnsLink> dns;
    ClockFn clock;
    std::vector<DiscoveryMethod> methods;

    mutable std::mutex mutex;
    std::unordered_map<std::string, AgentRecord> cache;
    DiscoveryStats stats;

    Impl(const DiscoveryConfig& cfg, std::shared_ptr<RegistryLink> reg,
         std::shared_ptr<DnsLink> dns_link, ClockFn clk)
        : config(cfg), registry(std::move(reg)), dns(std::move(dns_link)), clock(std::move(clk)) {
        methods = parse_discovery_methods(cfg.methods);
    }

    uint64_t ttl_ms() const {
        return static_cast<uint64_t>(config.cache_ttl_sec) * 1000;
    }

    bool fresh(const AgentRecord& record, uint64_t now) const {
        return now >= record.cache_time_ms && now - record.cache_time_ms < ttl_ms();
    }

    AgentRecord store(AgentRecord record, Provenance source) {
        record.source = source;
        record.cache_time_ms = clock();
        std::lock_guard<std::mutex> lock(mutex);
        cache[record.id] = record;
        return record;
    }

    void count_failure() {
        std::lock_guard<std::mutex> lock(mutex);
        ++stats.failures;
    }

    std::optional<AgentRecord> from_registry(const std::string& id) {
        if (!registry) return std::nullopt;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++stats.registry_lookups;
        }
        try {
            return registry->get_agent(id);
        } catch (const std::exception& e) {
            Logger::instance().warning("Registry lookup failed for {}: {}", id, e.what());
            return std::nullopt;
        }
    }

    std::optional<AgentRecord> from_dns(const std::string& id) {
        if (!dns) return std::nullopt;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++stats.dns_lookups;
        }
        try {
            return dns->resolve_agent(id);
        } catch (const std::exception& e) {
            Logger::instance().warning("DNS lookup failed for {}: {}", id, e.what());
            return std::nullopt;
        }
    }

    // Walks the configured methods in order without consulting the cache
    std::optional<AgentRecord> lookup(const std::string& id) {
        for (auto method : methods) {
            std::optional<AgentRecord> found;
            Provenance source = Provenance::Unknown;
            if (method == DiscoveryMethod::Registry) {
                found = from_registry(id);
                source = Provenance::Registry;
            } else {
                found = from_dns(id);
                source = Provenance::Dns;
            }

            if (found) {
                Logger::instance().debug("Resolved {} via {}", id, to_string(source));
                found->id = id;
                return store(std::move(*found), source);
            }
        }

        Logger::instance().warning("Failed to resolve agent " + id);
        count_failure();
        return std::nullopt;
    }

    std::vector<AgentRecord> search(const AgentQuery& query, const SearchCriteria* criteria) {
        std::vector<AgentRecord> results;
        if (!registry) return results;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++stats.registry_lookups;
        }

        std::vector<AgentRecord> agents;
        try {
            agents = registry->list_agents(query);
        } catch (const std::exception& e) {
            Logger::instance().error(std::string("Error searching registry: ") + e.what());
            count_failure();
            return results;
        }

        for (auto& agent : agents) {
            if (criteria && !criteria->matches(agent)) continue;
            results.push_back(store(std::move(agent), Provenance::Registry));
        }
        return results;
    }
};

DiscoveryCache::DiscoveryCache(const DiscoveryConfig& config,
                               std::shared_ptr<RegistryLink> registry,
                               std::shared_ptr<DnsLink> dns,
                               ClockFn clock)
    : impl_(std::make_unique<Impl>(config, std::move(registry), std::move(dns), std::move(clock))) {}

DiscoveryCache::~DiscoveryCache() = default;

std::optional<AgentRecord> DiscoveryCache::resolve(const std::string& id) {
    if (id.empty()) return std::nullopt;

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->cache.find(id);
        if (it != impl_->cache.end() && impl_->fresh(it->second, impl_->clock())) {
            ++impl_->stats.cache_hits;
            return it->second;
        }
        ++impl_->stats.cache_misses;
    }

    return impl_->lookup(id);
}

std::vector<AgentRecord> DiscoveryCache::resolve_by_capability(const std::string& capability) {
    AgentQuery query;
    query.capability = capability;
    auto results = impl_->search(query, nullptr);
    Logger::instance().info("Found {} agents with capability {}", results.size(), capability);
    return results;
}

std::vector<AgentRecord> DiscoveryCache::resolve_by_criteria(const SearchCriteria& criteria) {
    // The directory filters on a single capability; the rest is re-checked locally
    AgentQuery query;
    if (!criteria.capabilities.empty()) {
        query.capability = criteria.capabilities.front();
    }
    query.query = criteria.query;
    query.protocol = criteria.protocol;
    query.provider = criteria.provider;
    query.limit = criteria.limit;
    query.offset = criteria.offset;
    return impl_->search(query, &criteria);
}

std::vector<AgentRecord> DiscoveryCache::list_all() {
    return impl_->search(AgentQuery{}, nullptr);
}

void DiscoveryCache::invalidate(const std::string& id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->cache.erase(id);
}

void DiscoveryCache::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->cache.clear();
    Logger::instance().info("Discovery cache cleared");
}

size_t DiscoveryCache::refresh() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        ids.reserve(impl_->cache.size());
        for (const auto& [id, record] : impl_->cache) {
            ids.push_back(id);
        }
    }

    size_t refreshed = 0;
    for (const auto& id : ids) {
        if (impl_->lookup(id)) ++refreshed;
    }
    Logger::instance().info("Refreshed {}/{} cached agents", refreshed, ids.size());
    return refreshed;
}

std::optional<AgentRecord> DiscoveryCache::peek(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->cache.find(id);
    if (it == impl_->cache.end()) return std::nullopt;
    return it->second;
}

size_t DiscoveryCache::size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->cache.size();
}

DiscoveryStats DiscoveryCache::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    DiscoveryStats copy = impl_->stats;
    copy.cached_entries = impl_->cache.size();
    return copy;
}

const std::vector<DiscoveryMethod>& DiscoveryCache::methods() const {
    return impl_->methods;
}

} // namespace agentmesh
