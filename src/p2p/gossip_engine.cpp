#include "agentmesh/p2p/gossip_engine.h"
#include "agentmesh/p2p/peer_table.h"
#include "agentmesh/p2p/peer_transport.h"
#include "agentmesh/discovery/discovery_cache.h"
#include "agentmesh/base/clock.h"
#include "agentmesh/base/logger.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iterator>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_set>

namespace agentmesh {

nlohmann::json stats_to_json(const GossipStats& stats) {
    return {
        {"rounds_initiated", stats.rounds_initiated},
        {"rounds_completed", stats.rounds_completed},
        {"messages_sent", stats.messages_sent},
        {"messages_received", stats.messages_received},
        {"peers_sent", stats.peers_sent},
        {"peers_received", stats.peers_received},
        {"new_peers_discovered", stats.new_peers_discovered},
        {"stale_peers_removed", stats.stale_peers_removed},
        {"errors", stats.errors},
        {"last_gossip_time", stats.last_gossip_time}
    };
}

struct GossipEngine::Impl {
    GossipConfig config;
    PeerConfig peer_config;
    std::shared_ptr<PeerTable> peers;
    std::shared_ptr<DiscoveryCache> discovery;
    std::shared_ptr<PeerTransport> transport;
    ClockFn clock;

    std::atomic<bool> running{false};
    std::thread loop_thread;
    std::mutex lifecycle_mutex;

    mutable std::mutex stats_mutex;
    GossipStats stats;

    std::mutex rng_mutex;
    std::mt19937 rng{std::random_device{}()};

    Impl(const GossipConfig& cfg, const PeerConfig& pcfg,
         std::shared_ptr<PeerTable> table,
         std::shared_ptr<DiscoveryCache> cache,
         std::shared_ptr<PeerTransport> t,
         ClockFn clk)
        : config(cfg), peer_config(pcfg), peers(std::move(table)),
          discovery(std::move(cache)), transport(std::move(t)), clock(std::move(clk)) {}

    template <typename Fn>
    void update_stats(Fn&& fn) {
        std::lock_guard<std::mutex> lock(stats_mutex);
        fn(stats);
    }

    // Uniform sample without replacement; the whole population if n >= size
    std::vector<std::string> sample(const std::vector<std::string>& population, size_t n) {
        if (n >= population.size()) {
            std::vector<std::string> all = population;
            std::lock_guard<std::mutex> lock(rng_mutex);
            std::shuffle(all.begin(), all.end(), rng);
            return all;
        }
        std::vector<std::string> picked;
        picked.reserve(n);
        std::lock_guard<std::mutex> lock(rng_mutex);
        std::sample(population.begin(), population.end(), std::back_inserter(picked), n, rng);
        return picked;
    }

    // Resolves ids we have not seen; unresolvable ids become placeholders
    std::vector<std::string> fold(const std::vector<std::string>& peer_ids,
                                  const std::string& skip_id,
                                  const std::string& source) {
        std::vector<std::string> added;
        std::unordered_set<std::string> seen;

        for (const auto& id : peer_ids) {
            if (id.empty() || id == peers->self_id() || id == skip_id) continue;
            if (!seen.insert(id).second) continue;
            if (peers->contains(id)) continue;

            std::optional<AgentRecord> record;
            if (discovery) {
                record = discovery->resolve(id);
            }

            // Another writer may have stored the id while we were resolving
            bool inserted = record
                ? peers->insert_if_absent(id, *record)
                : peers->insert_if_absent(id, make_placeholder(id, source));
            if (!inserted) continue;

            if (!record) {
                Logger::instance().debug("Inserted placeholder for {} learned from {}", id, source);
            }
            added.push_back(id);
        }

        if (!added.empty()) {
            update_stats([&](GossipStats& s) { s.new_peers_discovered += added.size(); });
        }
        return added;
    }

    uint32_t effective_interval() const {
        return config.interval_sec < 1 ? 60 : config.interval_sec;
    }
};

GossipEngine::GossipEngine(const GossipConfig& gossip_config,
                           const PeerConfig& peer_config,
                           std::shared_ptr<PeerTable> peers,
                           std::shared_ptr<DiscoveryCache> discovery,
                           std::shared_ptr<PeerTransport> transport,
                           ClockFn clock)
    : impl_(std::make_unique<Impl>(gossip_config, peer_config, std::move(peers),
                                   std::move(discovery), std::move(transport),
                                   std::move(clock))) {}

GossipEngine::~GossipEngine() {
    stop();
}

bool GossipEngine::start() {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->running.load()) {
        Logger::instance().warning("Gossip loop already running");
        return false;
    }
    if (impl_->loop_thread.joinable()) {
        impl_->loop_thread.join();
    }

    impl_->running = true;
    impl_->loop_thread = std::thread([this]() {
        Logger::instance().info("Starting gossip loop");
        uint32_t interval = impl_->effective_interval();

        while (impl_->running.load()) {
            try {
                run_round();
            } catch (const std::exception& e) {
                Logger::instance().error(std::string("Error in gossip round: ") + e.what());
                impl_->update_stats([](GossipStats& s) { ++s.errors; });
            }

            // Sleep in one second slices so stop() is honored promptly
            for (uint32_t i = 0; i < interval && impl_->running.load(); ++i) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }

        Logger::instance().info("Gossip loop stopped");
    });
    Logger::instance().info("Started gossip with interval {}s, fanout {}",
                            impl_->config.interval_sec, impl_->config.fanout);
    return true;
}

bool GossipEngine::stop() {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (!impl_->running.exchange(false)) {
        return false;
    }
    if (impl_->loop_thread.joinable()) {
        impl_->loop_thread.join();
    }
    return true;
}

bool GossipEngine::is_running() const {
    return impl_->running.load();
}

void GossipEngine::seed(uint32_t value) {
    std::lock_guard<std::mutex> lock(impl_->rng_mutex);
    impl_->rng.seed(value);
}

GossipStats GossipEngine::stats() const {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    return impl_->stats;
}

std::vector<std::string> GossipEngine::select_targets() {
    size_t fanout = impl_->config.fanout;
    if (fanout == 0) return {};

    std::vector<std::string> usable;
    std::unordered_set<std::string> usable_set;
    for (const auto& entry : impl_->peers->usable_peers()) {
        usable.push_back(entry.id);
        usable_set.insert(entry.id);
    }

    if (usable.size() >= fanout) {
        return impl_->sample(usable, fanout);
    }

    // Pad with the remaining known peers
    std::vector<std::string> targets = impl_->sample(usable, usable.size());
    std::vector<std::string> others;
    for (const auto& id : impl_->peers->ids()) {
        if (!usable_set.count(id) && id != impl_->peers->self_id()) {
            others.push_back(id);
        }
    }
    auto padding = impl_->sample(others, fanout - targets.size());
    targets.insert(targets.end(), padding.begin(), padding.end());
    return targets;
}

std::vector<std::string> GossipEngine::select_peers_to_send(const std::string& target) {
    std::vector<std::string> candidates;
    for (const auto& id : impl_->peers->ids()) {
        if (id != target && id != impl_->peers->self_id()) {
            candidates.push_back(id);
        }
    }

    size_t cap = impl_->config.max_peers_per_message;
    if (candidates.size() > cap) {
        return impl_->sample(candidates, cap);
    }
    return candidates;
}

ExchangeResult GossipEngine::exchange_with(const std::string& peer_id) {
    ExchangeResult result;
    result.peer_id = peer_id;

    auto fail = [&](ErrorCode code, const std::string& message) {
        result.success = false;
        result.error = code;
        result.error_message = message;
        impl_->update_stats([](GossipStats& s) { ++s.errors; });
        Logger::instance().warning("Gossip with {} failed: {}", peer_id, message);
        return result;
    };

    auto entry = impl_->peers->entry(peer_id);
    if (!entry) {
        return fail(ErrorCode::NotFound, "Peer not found");
    }
    if (entry->address.host.empty()) {
        return fail(ErrorCode::InvalidPeerMetadata, "Cannot determine peer host");
    }
    if (!impl_->transport) {
        return fail(ErrorCode::InternalError, "No peer transport configured");
    }

    // Step 1: their peer list
    std::vector<std::string> their_peers;
    try {
        their_peers = impl_->transport->fetch_peers(entry->address);
    } catch (const AgentMeshError& e) {
        return fail(e.code(), std::string("Failed to get peers: ") + e.what());
    } catch (const std::exception& e) {
        return fail(ErrorCode::NetworkError, std::string("Failed to get peers: ") + e.what());
    }

    // Step 2: our peer list
    std::vector<std::string> our_peers = select_peers_to_send(peer_id);
    try {
        impl_->transport->push_peers(entry->address, our_peers);
    } catch (const AgentMeshError& e) {
        return fail(e.code(), std::string("Failed to send peers: ") + e.what());
    } catch (const std::exception& e) {
        return fail(ErrorCode::NetworkError, std::string("Failed to send peers: ") + e.what());
    }

    impl_->update_stats([&](GossipStats& s) {
        ++s.messages_sent;
        s.peers_sent += our_peers.size();
        s.peers_received += their_peers.size();
    });

    // Step 3: fold what we learned
    result.new_peers = impl_->fold(their_peers, peer_id, peer_id);
    result.success = true;
    result.sent_peers = our_peers.size();
    result.received_peers = their_peers.size();

    Logger::instance().debug("Gossip with {}: sent {}, received {}, new {}",
                             peer_id, result.sent_peers, result.received_peers, result.new_peers.size());
    return result;
}

InboundResult GossipEngine::receive_peers(const std::vector<std::string>& peer_ids,
                                          const std::string& source) {
    impl_->update_stats([&](GossipStats& s) {
        ++s.messages_received;
        s.peers_received += peer_ids.size();
    });

    InboundResult result;
    result.added_peers = impl_->fold(peer_ids, std::string(), source);
    result.total_peers = impl_->peers->size();

    if (!result.added_peers.empty()) {
        Logger::instance().info("Added {} peers pushed by {}", result.added_peers.size(), source);
    }
    return result;
}

RoundResult GossipEngine::run_round() {
    auto start = std::chrono::steady_clock::now();
    double start_time = static_cast<double>(impl_->clock()) / 1000.0;
    impl_->update_stats([](GossipStats& s) { ++s.rounds_initiated; });

    RoundResult round;
    round.stale_removed = impl_->peers->evict_stale(impl_->peer_config.peer_ttl_sec);
    if (!round.stale_removed.empty()) {
        impl_->update_stats([&](GossipStats& s) { s.stale_peers_removed += round.stale_removed.size(); });
    }

    round.targets = select_targets();
    if (round.targets.empty()) {
        Logger::instance().debug("No peers available for gossip");
        round.status = RoundStatus::NoPeers;
        return round;
    }

    // Bounded pool: each worker pulls the next target index
    round.results.resize(round.targets.size());
    size_t workers = std::min<size_t>(round.targets.size(),
                                      std::max<uint32_t>(1, impl_->config.max_concurrent_exchanges));
    std::atomic<size_t> next{0};
    auto work = [&]() {
        for (size_t i = next.fetch_add(1); i < round.targets.size(); i = next.fetch_add(1)) {
            try {
                round.results[i] = exchange_with(round.targets[i]);
            } catch (const std::exception& e) {
                ExchangeResult failed;
                failed.peer_id = round.targets[i];
                failed.error = ErrorCode::InternalError;
                failed.error_message = e.what();
                impl_->update_stats([](GossipStats& s) { ++s.errors; });
                round.results[i] = std::move(failed);
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        pool.emplace_back(work);
    }
    for (auto& t : pool) {
        t.join();
    }

    for (const auto& result : round.results) {
        if (result.success) {
            impl_->peers->update_health(result.peer_id, PeerHealth::Healthy);
        }
    }

    round.status = RoundStatus::Completed;
    round.duration_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
    impl_->update_stats([&](GossipStats& s) {
        ++s.rounds_completed;
        s.last_gossip_time = start_time;
    });

    size_t succeeded = std::count_if(round.results.begin(), round.results.end(),
                                     [](const ExchangeResult& r) { return r.success; });
    Logger::instance().info("Gossip round completed: {}/{} exchanges succeeded, {} stale removed, {}ms",
                            succeeded, round.targets.size(), round.stale_removed.size(), round.duration_ms);
    return round;
}

} // namespace agentmesh
