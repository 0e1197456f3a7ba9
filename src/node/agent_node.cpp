#include "agentmesh/node/agent_node.h"
#include "agentmesh/control/registration_manager.h"
#include "agentmesh/discovery/discovery_cache.h"
#include "agentmesh/discovery/dns_resolver.h"
#include "agentmesh/discovery/registry_client.h"
#include "agentmesh/p2p/gossip_engine.h"
#include "agentmesh/p2p/peer_server.h"
#include "agentmesh/p2p/peer_table.h"
#include "agentmesh/p2p/peer_transport.h"
#include "agentmesh/base/logger.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace agentmesh {

struct AgentNode::Impl {
    GlobalConfig config;
    ClockFn clock;
    bool serve_http;

    std::shared_ptr<RegistryLink> registry;
    std::shared_ptr<DnsLink> dns;
    std::shared_ptr<PeerTransport> transport;

    std::shared_ptr<DiscoveryCache> discovery;
    std::shared_ptr<PeerTable> peers;
    std::shared_ptr<GossipEngine> gossip;
    std::unique_ptr<RegistrationManager> registration;
    std::unique_ptr<PeerServer> server;

    std::atomic<bool> running{false};
    std::thread heartbeat_thread;
    std::thread refresh_thread;
    std::thread gossip_starter;

    Impl(const GlobalConfig& cfg, AgentNodeDeps deps)
        : config(cfg),
          clock(deps.clock ? std::move(deps.clock) : system_clock_fn()),
          serve_http(deps.serve_http),
          registry(std::move(deps.registry)),
          dns(std::move(deps.dns)),
          transport(std::move(deps.transport)) {
        if (!registry) {
            registry = std::make_shared<RegistryClient>(config.registry);
        }
        if (!dns) {
            dns = std::make_shared<DnsResolver>(config.dns);
        }
        if (!transport) {
            transport = std::make_shared<HttpPeerTransport>(config.gossip.exchange_timeout_sec,
                                                            config.peers.health_timeout_sec);
        }
    }

    // Sleeps in one second slices; returns false once stop was requested
    bool wait(uint32_t seconds) {
        for (uint32_t i = 0; i < seconds; ++i) {
            if (!running.load()) return false;
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        return running.load();
    }
};

AgentNode::AgentNode(const GlobalConfig& config, AgentNodeDeps deps)
    : impl_(std::make_unique<Impl>(config, std::move(deps))) {
    const auto& cfg = impl_->config;

    impl_->discovery = std::make_shared<DiscoveryCache>(cfg.discovery, impl_->registry,
                                                        impl_->dns, impl_->clock);
    impl_->peers = std::make_shared<PeerTable>(cfg.node.agent_id, impl_->transport, impl_->clock);

    UsablePeerPolicy policy;
    policy.recent_window_sec = cfg.peers.recent_window_sec;
    impl_->peers->set_policy(policy);

    impl_->gossip = std::make_shared<GossipEngine>(cfg.gossip, cfg.peers, impl_->peers,
                                                   impl_->discovery, impl_->transport,
                                                   impl_->clock);
    impl_->registration = std::make_unique<RegistrationManager>(
        cfg.registration, impl_->registry, [this]() { return self_record(); }, impl_->clock);
    impl_->server = std::make_unique<PeerServer>(cfg.node, impl_->peers, impl_->gossip,
                                                 [this]() { return self_record(); });
}

AgentNode::~AgentNode() {
    stop();
}

AgentRecord AgentNode::self_record() const {
    const auto& node = impl_->config.node;

    AgentRecord record;
    record.id = node.agent_id;
    record.name = node.name;
    record.description = node.description;
    record.capabilities = node.capabilities;
    record.interfaces["rest"] = "http://" + node.host + ":" + std::to_string(node.port) + "/v1";
    record.endpoints = {
        {"metadata", "/metadata"},
        {"peers", "/peers"},
        {"health", "/health"},
        {"gossip_stats", "/gossip/stats"}
    };
    record.host = node.host;
    record.port = std::to_string(node.port);
    record.version = node.version;
    record.protocols = node.protocols;
    record.provider = node.provider;
    record.owner = node.owner;
    record.last_update = static_cast<double>(impl_->clock()) / 1000.0;
    return record;
}

size_t AgentNode::fetch_peers() {
    size_t added = 0;
    for (const auto& agent : impl_->discovery->list_all()) {
        if (impl_->peers->upsert(agent.id, agent)) {
            ++added;
        }
    }
    Logger::instance().info("Fetched {} peers from registry", added);
    return added;
}

size_t AgentNode::refresh_peer_discovery() {
    size_t found = 0;
    for (const auto& capability : impl_->config.node.capabilities) {
        for (const auto& agent : impl_->discovery->resolve_by_capability(capability)) {
            if (impl_->peers->upsert(agent.id, agent)) {
                ++found;
            }
        }
    }
    return found;
}

size_t AgentNode::refresh() {
    size_t total = fetch_peers();
    total += refresh_peer_discovery();
    Logger::instance().info("Peer refresh complete, {} peers known", impl_->peers->size());
    return total;
}

bool AgentNode::start() {
    if (impl_->running.exchange(true)) {
        Logger::instance().warning("Agent node already running");
        return false;
    }

    Logger::instance().info("Starting agent node " + impl_->config.node.agent_id);

    if (impl_->serve_http && !impl_->server->start()) {
        Logger::instance().error("Failed to start peer server");
        impl_->running = false;
        return false;
    }

    uint32_t first_delay = impl_->registration->tick();
    refresh();

    impl_->heartbeat_thread = std::thread([this, first_delay]() {
        uint32_t delay = first_delay;
        while (impl_->wait(std::max<uint32_t>(1, delay))) {
            delay = impl_->registration->tick();
        }
    });

    impl_->refresh_thread = std::thread([this]() {
        uint32_t interval = std::max<uint32_t>(1, impl_->config.discovery.refresh_interval_sec);
        while (impl_->wait(interval)) {
            refresh();
        }
    });

    if (impl_->config.gossip.enable) {
        impl_->gossip_starter = std::thread([this]() {
            if (!impl_->wait(impl_->config.gossip.startup_delay_sec)) return;
            if (impl_->peers->size() < 2) {
                Logger::instance().info("Few peers known, refreshing before gossip");
                refresh();
            }
            if (impl_->running.load()) {
                impl_->gossip->start();
            }
        });
    }

    Logger::instance().info("Agent node started");
    return true;
}

void AgentNode::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    Logger::instance().info("Stopping agent node");

    for (auto* t : {&impl_->gossip_starter, &impl_->heartbeat_thread, &impl_->refresh_thread}) {
        if (t->joinable()) t->join();
    }
    impl_->gossip->stop();
    impl_->server->stop();

    if (impl_->config.registry.unregister_on_stop) {
        impl_->registration->unregister();
    }
    Logger::instance().info("Agent node stopped");
}

bool AgentNode::is_running() const {
    return impl_->running.load();
}

DiscoveryCache& AgentNode::discovery() {
    return *impl_->discovery;
}

PeerTable& AgentNode::peers() {
    return *impl_->peers;
}

GossipEngine& AgentNode::gossip() {
    return *impl_->gossip;
}

RegistrationManager& AgentNode::registration() {
    return *impl_->registration;
}

PeerServer& AgentNode::server() {
    return *impl_->server;
}

} // namespace agentmesh
