#include "agentmesh/p2p/peer_server.h"
#include "agentmesh/p2p/gossip_engine.h"
#include "agentmesh/p2p/peer_table.h"
#include "agentmesh/base/logger.h"
#include <elio/elio.hpp>
#include <elio/http/http.hpp>
#include <atomic>
#include <chrono>
#include <thread>

using json = nlohmann::json;

namespace agentmesh {

namespace {

elio::http::response to_response(const HandlerResult& result) {
    elio::http::status status = elio::http::status::ok;
    switch (result.status) {
        case 200: status = elio::http::status::ok; break;
        case 400: status = elio::http::status::bad_request; break;
        case 404: status = elio::http::status::not_found; break;
        default: status = elio::http::status::service_unavailable; break;
    }
    return elio::http::response(status, result.body.dump(), elio::http::mime::application_json);
}

std::string body_of(const elio::http::request& req) {
    auto body = req.body();
    return std::string(body.begin(), body.end());
}

} // anonymous namespace

struct PeerServer::Impl {
    NodeConfig config;
    std::shared_ptr<PeerTable> peers;
    std::shared_ptr<GossipEngine> gossip;
    std::function<AgentRecord()> metadata_provider;

    std::atomic<bool> running{false};
    std::thread server_thread;
    std::unique_ptr<elio::http::server> http_server;

    Impl(const NodeConfig& cfg, std::shared_ptr<PeerTable> table,
         std::shared_ptr<GossipEngine> engine, std::function<AgentRecord()> provider)
        : config(cfg), peers(std::move(table)), gossip(std::move(engine)),
          metadata_provider(std::move(provider)) {}
};

PeerServer::PeerServer(const NodeConfig& config,
                       std::shared_ptr<PeerTable> peers,
                       std::shared_ptr<GossipEngine> gossip,
                       std::function<AgentRecord()> metadata_provider)
    : impl_(std::make_unique<Impl>(config, std::move(peers), std::move(gossip),
                                   std::move(metadata_provider))) {}

PeerServer::~PeerServer() {
    stop();
}

HandlerResult PeerServer::handle_get_peers() const {
    return {200, {{"peers", impl_->peers->ids()}}};
}

HandlerResult PeerServer::handle_post_peers(const std::string& body) {
    json doc;
    try {
        doc = body.empty() ? json::object() : json::parse(body);
    } catch (const json::exception& e) {
        Logger::instance().warning("Failed to parse JSON body: " + std::string(e.what()));
        return {400, {{"error", "Invalid peer data"}}};
    }

    if (!doc.is_object() || !doc.contains("peers") || !doc["peers"].is_array()) {
        return {400, {{"error", "Invalid peer data"}}};
    }

    std::vector<std::string> ids;
    for (const auto& item : doc["peers"]) {
        if (item.is_string()) ids.push_back(item.get<std::string>());
    }

    // Pushes carry no sender id; placeholders record the push itself as their origin
    auto result = impl_->gossip->receive_peers(ids, "peer-push");
    return {200, {
        {"status", "success"},
        {"added_peers", result.added_peers},
        {"total_peers", result.total_peers}
    }};
}

HandlerResult PeerServer::handle_health() const {
    return {200, {{"status", "ok"}}};
}

HandlerResult PeerServer::handle_metadata() const {
    return {200, agent_to_json(impl_->metadata_provider())};
}

HandlerResult PeerServer::handle_gossip_stats() const {
    json body = stats_to_json(impl_->gossip->stats());
    body["running"] = impl_->gossip->is_running();
    body["known_peers"] = impl_->peers->size();
    return {200, body};
}

HandlerResult PeerServer::handle_gossip_start() {
    bool started = impl_->gossip->start();
    return {200, {{"status", started ? "started" : "failed"}}};
}

HandlerResult PeerServer::handle_gossip_stop() {
    bool stopped = impl_->gossip->stop();
    return {200, {{"status", stopped ? "stopped" : "not running"}}};
}

bool PeerServer::start() {
    if (impl_->running) {
        return false;
    }

    Logger::instance().info("Starting peer server on " + impl_->config.bind_address + ":" +
                            std::to_string(impl_->config.port));
    impl_->running = true;

    elio::http::router r;

    r.get("/peers", [this](elio::http::context&)
          -> elio::coro::task<elio::http::response> {
        co_return to_response(handle_get_peers());
    });

    r.post("/peers", [this](elio::http::context& ctx)
           -> elio::coro::task<elio::http::response> {
        co_return to_response(handle_post_peers(body_of(ctx.req())));
    });

    r.get("/health", [this](elio::http::context&)
          -> elio::coro::task<elio::http::response> {
        co_return to_response(handle_health());
    });

    r.get("/metadata", [this](elio::http::context&)
          -> elio::coro::task<elio::http::response> {
        co_return to_response(handle_metadata());
    });

    r.get("/gossip/stats", [this](elio::http::context&)
          -> elio::coro::task<elio::http::response> {
        co_return to_response(handle_gossip_stats());
    });

    r.post("/gossip/start", [this](elio::http::context&)
           -> elio::coro::task<elio::http::response> {
        co_return to_response(handle_gossip_start());
    });

    r.post("/gossip/stop", [this](elio::http::context&)
           -> elio::coro::task<elio::http::response> {
        co_return to_response(handle_gossip_stop());
    });

    impl_->http_server = std::make_unique<elio::http::server>(std::move(r));

    impl_->http_server->set_not_found_handler([](elio::http::context& ctx)
        -> elio::coro::task<elio::http::response> {
        json error = {{"error", "Not Found"}, {"path", std::string(ctx.req().path())}};
        co_return elio::http::response(elio::http::status::not_found, error.dump(),
                                       elio::http::mime::application_json);
    });

    elio::net::socket_address bind_addr;
    if (impl_->config.bind_address == "0.0.0.0") {
        bind_addr = elio::net::socket_address(elio::net::ipv6_address(impl_->config.port));
    } else {
        bind_addr = elio::net::socket_address(impl_->config.bind_address, impl_->config.port);
    }

    elio::net::tcp_options opts;
    opts.ipv6_only = (impl_->config.bind_address != "0.0.0.0");

    impl_->server_thread = std::thread([this, bind_addr, opts]() {
        elio::run([this, bind_addr, opts]() -> elio::coro::task<void> {
            auto listen_task = impl_->http_server->listen(bind_addr, opts);
            auto listen_handle = std::move(listen_task).spawn();

            while (impl_->running) {
                co_await elio::time::sleep_for(std::chrono::milliseconds(100));
            }

            impl_->http_server->stop();
            co_await listen_handle;
            co_return;
        }());
        Logger::instance().info("Peer server thread exiting");
    });

    Logger::instance().info("Peer server started");
    return true;
}

void PeerServer::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    Logger::instance().info("Stopping peer server");
    if (impl_->server_thread.joinable()) {
        impl_->server_thread.join();
    }
    Logger::instance().info("Peer server stopped");
}

bool PeerServer::is_running() const {
    return impl_->running.load();
}

} // namespace agentmesh
