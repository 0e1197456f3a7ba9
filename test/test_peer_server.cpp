#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>
#include <vector>
#include "agentmesh/p2p/peer_server.h"
#include "agentmesh/p2p/gossip_engine.h"
#include "agentmesh/p2p/peer_table.h"
#include "agentmesh/discovery/discovery_cache.h"
#include "fakes.h"

using namespace agentmesh;
using namespace agentmesh::test;

namespace {

struct ServerFixture {
    FakeClock clock;
    std::shared_ptr<FakeRegistry> registry = std::make_shared<FakeRegistry>();
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<PeerTable> table;
    std::shared_ptr<GossipEngine> gossip;
    std::unique_ptr<PeerServer> server;

    ServerFixture() {
        table = std::make_shared<PeerTable>("self.agents.local", transport, clock.fn());
        auto cache = std::make_shared<DiscoveryCache>(DiscoveryConfig{}, registry, nullptr, clock.fn());
        gossip = std::make_shared<GossipEngine>(GossipConfig{}, PeerConfig{}, table, cache, transport);

        NodeConfig node;
        node.agent_id = "self.agents.local";
        server = std::make_unique<PeerServer>(node, table, gossip, []() {
            auto record = make_agent("self.agents.local", {"chat"}, "Self");
            record.host = "self";
            record.port = "8000";
            return record;
        });
    }
};

} // anonymous namespace

TEST_CASE("Peer Server GET peers", "[server][peers]") {
    ServerFixture f;
    REQUIRE(f.server->handle_get_peers().body["peers"].empty());

    f.table->upsert("a.agents.local", make_agent("a.agents.local"));
    f.table->upsert("b.agents.local", make_agent("b.agents.local"));

    auto result = f.server->handle_get_peers();
    REQUIRE(result.status == 200);
    auto ids = result.body["peers"].get<std::vector<std::string>>();
    std::sort(ids.begin(), ids.end());
    REQUIRE(ids == std::vector<std::string>{"a.agents.local", "b.agents.local"});
}

TEST_CASE("Peer Server POST peers", "[server][peers]") {
    ServerFixture f;
    f.table->upsert("a.agents.local", make_agent("a.agents.local"));

    auto result = f.server->handle_post_peers(
        R"({"peers": ["a.agents.local", "self.agents.local", "c.agents.local", 42]})");
    REQUIRE(result.status == 200);
    REQUIRE(result.body["status"] == "success");
    REQUIRE(result.body["added_peers"] == nlohmann::json::array({"c.agents.local"}));
    REQUIRE(result.body["total_peers"] == 2);

    auto placeholder = f.table->get("c.agents.local");
    REQUIRE(placeholder->needs_resolution);
    REQUIRE(placeholder->discovered_via == "peer-push");
    REQUIRE(f.gossip->stats().messages_received == 1);
}

TEST_CASE("Peer Server Rejects Invalid Peer Data", "[server][peers]") {
    ServerFixture f;
    for (const std::string body : {"not json", "", "[]", R"({"peers": "a"})", R"({"other": []})"}) {
        auto result = f.server->handle_post_peers(body);
        REQUIRE(result.status == 400);
        REQUIRE(result.body["error"] == "Invalid peer data");
    }
    REQUIRE(f.table->size() == 0);
    REQUIRE(f.gossip->stats().messages_received == 0);
}

TEST_CASE("Peer Server Health And Metadata", "[server]") {
    ServerFixture f;
    auto health = f.server->handle_health();
    REQUIRE(health.status == 200);
    REQUIRE(health.body["status"] == "ok");

    auto metadata = f.server->handle_metadata();
    REQUIRE(metadata.status == 200);
    REQUIRE(metadata.body["id"] == "self.agents.local");
    REQUIRE(metadata.body["name"] == "Self");
    REQUIRE(metadata.body["port"] == 8000);
}

TEST_CASE("Peer Server Gossip Control", "[server][gossip]") {
    ServerFixture f;
    f.table->upsert("a.agents.local", make_agent("a.agents.local"));

    auto stats = f.server->handle_gossip_stats();
    REQUIRE(stats.body["running"] == false);
    REQUIRE(stats.body["known_peers"] == 1);
    REQUIRE(stats.body["rounds_initiated"] == 0);

    REQUIRE(f.server->handle_gossip_start().body["status"] == "started");
    REQUIRE(f.server->handle_gossip_start().body["status"] == "failed");
    REQUIRE(f.server->handle_gossip_stats().body["running"] == true);
    REQUIRE(f.server->handle_gossip_stop().body["status"] == "stopped");
    REQUIRE(f.server->handle_gossip_stop().body["status"] == "not running");
}
