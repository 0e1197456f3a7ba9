#ifndef AGENTMESH_TEST_FAKES_H
#define AGENTMESH_TEST_FAKES_H

#include "agentmesh/base/clock.h"
#include "agentmesh/base/error_code.h"
#include "agentmesh/discovery/dns_resolver.h"
#include "agentmesh/discovery/registry_client.h"
#include "agentmesh/p2p/peer_transport.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace agentmesh::test {

// Manually advanced clock shared by every component under test
class FakeClock {
public:
    explicit FakeClock(uint64_t start_ms = 1'700'000'000'000ULL)
        : now_(std::make_shared<std::atomic<uint64_t>>(start_ms)) {}

    ClockFn fn() const {
        auto now = now_;
        return [now]() { return now->load(); };
    }

    uint64_t now() const { return now_->load(); }
    void advance_sec(uint64_t seconds) { *now_ += seconds * 1000; }
    void advance_ms(uint64_t ms) { *now_ += ms; }

private:
    std::shared_ptr<std::atomic<uint64_t>> now_;
};

inline AgentRecord make_agent(const std::string& id,
                              std::vector<std::string> capabilities = {},
                              const std::string& name = "") {
    AgentRecord record;
    record.id = id;
    record.name = name.empty() ? id : name;
    record.capabilities = std::move(capabilities);
    return record;
}

class FakeRegistry : public RegistryLink {
public:
    void add(const AgentRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        agents_[record.id] = record;
    }

    bool register_agent(const AgentRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++register_calls;
        registered_ids.push_back(record.id);
        bool ok = true;
        if (!register_results.empty()) {
            ok = register_results.front();
            register_results.pop_front();
        }
        if (ok) agents_[record.id] = record;
        return ok;
    }

    std::optional<AgentRecord> get_agent(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++get_calls;
        if (fail_lookups) {
            throw AgentMeshError(ErrorCode::RegistryError, "registry unavailable");
        }
        auto it = agents_.find(id);
        if (it == agents_.end()) return std::nullopt;
        return it->second;
    }

    // Filters on capability only, like the real directory's single parameter
    std::vector<AgentRecord> list_agents(const AgentQuery& query) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++list_calls;
        last_query = query;
        if (fail_lookups) {
            throw AgentMeshError(ErrorCode::RegistryError, "registry unavailable");
        }
        std::vector<AgentRecord> out;
        for (const auto& [id, record] : agents_) {
            if (query.capability.empty() || record.has_capability(query.capability)) {
                out.push_back(record);
            }
        }
        return out;
    }

    HeartbeatStatus heartbeat(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++heartbeat_calls;
        last_heartbeat_id = id;
        if (!heartbeat_results.empty()) {
            auto status = heartbeat_results.front();
            heartbeat_results.pop_front();
            return status;
        }
        return HeartbeatStatus::Ok;
    }

    bool unregister_agent(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++unregister_calls;
        return agents_.erase(id) > 0;
    }

    int register_calls = 0;
    int get_calls = 0;
    int list_calls = 0;
    int heartbeat_calls = 0;
    int unregister_calls = 0;
    bool fail_lookups = false;
    std::deque<bool> register_results;
    std::deque<HeartbeatStatus> heartbeat_results;
    std::vector<std::string> registered_ids;
    std::string last_heartbeat_id;
    AgentQuery last_query;

private:
    std::mutex mutex_;
    std::map<std::string, AgentRecord> agents_;
};

class FakeDns : public DnsLink {
public:
    void add(const AgentRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[record.id] = record;
    }

    std::optional<AgentRecord> resolve_agent(const std::string& id) override {
        // Runs unlocked, like a real lookup in flight
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        if (on_resolve) {
            on_resolve(id);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        call_order.push_back(id);
        if (fail) {
            throw AgentMeshError(ErrorCode::DnsLookupFailed, "dns down");
        }
        auto it = records_.find(id);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    int calls = 0;
    bool fail = false;
    int delay_ms = 0;
    std::function<void(const std::string&)> on_resolve;
    std::vector<std::string> call_order;

private:
    std::mutex mutex_;
    std::map<std::string, AgentRecord> records_;
};

// Peers are keyed by host, which for "name.agents.local" ids is "name"
class FakeTransport : public PeerTransport {
public:
    void set_peers(const std::string& host, std::vector<std::string> ids) {
        std::lock_guard<std::mutex> lock(mutex_);
        peer_lists_[host] = std::move(ids);
    }

    void set_unreachable(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreachable_.insert(host);
    }

    void set_health(const std::string& host, std::optional<int> status) {
        std::lock_guard<std::mutex> lock(mutex_);
        health_[host] = status;
    }

    std::vector<std::string> fetch_peers(const PeerAddress& address) override {
        if (delay_ms > 0) {
            size_t now_in_flight = ++in_flight;
            size_t peak = max_in_flight.load();
            while (now_in_flight > peak && !max_in_flight.compare_exchange_weak(peak, now_in_flight)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            --in_flight;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        fetched_hosts.push_back(address.host);
        if (unreachable_.count(address.host)) {
            throw AgentMeshError(ErrorCode::PeerUnreachable, address.to_string());
        }
        auto it = peer_lists_.find(address.host);
        return it == peer_lists_.end() ? std::vector<std::string>{} : it->second;
    }

    PushResult push_peers(const PeerAddress& address,
                          const std::vector<std::string>& peer_ids) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unreachable_.count(address.host)) {
            throw AgentMeshError(ErrorCode::PeerUnreachable, address.to_string());
        }
        pushes[address.host] = peer_ids;
        PushResult result;
        result.total_peers = peer_ids.size();
        return result;
    }

    std::optional<int> check_health(const PeerAddress& address) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++health_calls;
        auto it = health_.find(address.host);
        return it == health_.end() ? std::optional<int>(200) : it->second;
    }

    std::vector<std::string> fetched_hosts;
    std::map<std::string, std::vector<std::string>> pushes;
    int health_calls = 0;

    // Overlap tracking for fetches that take delay_ms
    int delay_ms = 0;
    std::atomic<size_t> in_flight{0};
    std::atomic<size_t> max_in_flight{0};

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> peer_lists_;
    std::set<std::string> unreachable_;
    std::map<std::string, std::optional<int>> health_;
};

} // namespace agentmesh::test

#endif // AGENTMESH_TEST_FAKES_H
