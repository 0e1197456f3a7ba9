#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "agentmesh/p2p/gossip_engine.h"
#include "agentmesh/p2p/peer_table.h"
#include "agentmesh/discovery/discovery_cache.h"
#include "fakes.h"

using namespace agentmesh;
using namespace agentmesh::test;

namespace {

const std::string kSelf = "self.agents.local";

std::string peer_id(int n) {
    return "p" + std::to_string(n) + ".agents.local";
}

struct GossipFixture {
    FakeClock clock;
    std::shared_ptr<FakeRegistry> registry = std::make_shared<FakeRegistry>();
    std::shared_ptr<FakeDns> dns = std::make_shared<FakeDns>();
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<PeerTable> table;
    std::shared_ptr<DiscoveryCache> cache;
    GossipConfig gossip_config;
    PeerConfig peer_config;

    GossipFixture() {
        table = std::make_shared<PeerTable>(kSelf, transport, clock.fn());
        cache = std::make_shared<DiscoveryCache>(DiscoveryConfig{}, registry, dns, clock.fn());
    }

    std::unique_ptr<GossipEngine> make() {
        auto engine = std::make_unique<GossipEngine>(gossip_config, peer_config, table, cache,
                                                     transport, clock.fn());
        engine->seed(42);
        return engine;
    }

    void add_peers(int count) {
        for (int i = 0; i < count; ++i) {
            table->upsert(peer_id(i), make_agent(peer_id(i)));
        }
    }
};

} // anonymous namespace

TEST_CASE("Gossip Selects Fanout Distinct Targets", "[gossip][targets]") {
    GossipFixture f;
    f.add_peers(10);
    auto engine = f.make();

    for (int round = 0; round < 20; ++round) {
        auto targets = engine->select_targets();
        REQUIRE(targets.size() == 3);
        std::set<std::string> distinct(targets.begin(), targets.end());
        REQUIRE(distinct.size() == 3);
        REQUIRE(distinct.count(kSelf) == 0);
    }
}

TEST_CASE("Gossip Pads Targets From Remaining Peers", "[gossip][targets]") {
    GossipFixture f;
    f.add_peers(5);
    UsablePeerPolicy policy;
    policy.trust_unchecked = false;
    f.table->set_policy(policy);
    f.table->update_health(peer_id(0), PeerHealth::Healthy);
    auto engine = f.make();

    auto targets = engine->select_targets();
    REQUIRE(targets.size() == 3);
    REQUIRE(targets.front() == peer_id(0));
    std::set<std::string> distinct(targets.begin(), targets.end());
    REQUIRE(distinct.size() == 3);
}

TEST_CASE("Gossip Targets Limited By Table Size", "[gossip][targets]") {
    GossipFixture f;
    f.add_peers(2);
    auto engine = f.make();
    REQUIRE(engine->select_targets().size() == 2);

    f.gossip_config.fanout = 0;
    REQUIRE(f.make()->select_targets().empty());
}

TEST_CASE("Gossip Peers To Send Exclude Target And Self", "[gossip][send]") {
    GossipFixture f;
    f.add_peers(15);
    auto engine = f.make();

    auto ids = engine->select_peers_to_send(peer_id(3));
    REQUIRE(ids.size() == f.gossip_config.max_peers_per_message);
    REQUIRE(std::find(ids.begin(), ids.end(), peer_id(3)) == ids.end());
    REQUIRE(std::find(ids.begin(), ids.end(), kSelf) == ids.end());

    GossipFixture small;
    small.add_peers(3);
    auto few = small.make()->select_peers_to_send(peer_id(0));
    std::sort(few.begin(), few.end());
    REQUIRE(few == std::vector<std::string>{peer_id(1), peer_id(2)});
}

TEST_CASE("Gossip Exchange Folds New Peers", "[gossip][exchange]") {
    GossipFixture f;
    f.add_peers(2);
    f.registry->add(make_agent("fresh.agents.local", {"chat"}));
    f.transport->set_peers("p0", {kSelf, peer_id(0), peer_id(1), "fresh.agents.local",
                                  "ghost.agents.local", "ghost.agents.local", ""});
    auto engine = f.make();

    auto result = engine->exchange_with(peer_id(0));
    REQUIRE(result.success);
    REQUIRE(result.received_peers == 7);
    REQUIRE(result.sent_peers == 1);
    REQUIRE(f.transport->pushes.at("p0") == std::vector<std::string>{peer_id(1)});

    std::sort(result.new_peers.begin(), result.new_peers.end());
    REQUIRE(result.new_peers == std::vector<std::string>{"fresh.agents.local", "ghost.agents.local"});

    auto fresh = f.table->get("fresh.agents.local");
    REQUIRE(fresh.has_value());
    REQUIRE(fresh->source == Provenance::Registry);
    REQUIRE_FALSE(fresh->needs_resolution);

    auto ghost = f.table->get("ghost.agents.local");
    REQUIRE(ghost.has_value());
    REQUIRE(ghost->needs_resolution);
    REQUIRE(ghost->discovered_via == peer_id(0));
    REQUIRE(f.table->health("ghost.agents.local") == PeerHealth::Unknown);

    REQUIRE_FALSE(f.table->contains(kSelf));

    auto stats = engine->stats();
    REQUIRE(stats.messages_sent == 1);
    REQUIRE(stats.peers_sent == 1);
    REQUIRE(stats.peers_received == 7);
    REQUIRE(stats.new_peers_discovered == 2);
    REQUIRE(stats.errors == 0);
}

TEST_CASE("Gossip Exchange Failures", "[gossip][exchange][failure]") {
    GossipFixture f;
    f.add_peers(1);
    f.table->upsert("nohost", make_agent("nohost"));
    f.transport->set_unreachable("p0");
    auto engine = f.make();

    auto unreachable = engine->exchange_with(peer_id(0));
    REQUIRE_FALSE(unreachable.success);
    REQUIRE(unreachable.error == ErrorCode::PeerUnreachable);

    auto missing = engine->exchange_with("nobody.agents.local");
    REQUIRE(missing.error == ErrorCode::NotFound);

    auto no_host = engine->exchange_with("nohost");
    REQUIRE(no_host.error == ErrorCode::InvalidPeerMetadata);

    REQUIRE(engine->stats().errors == 3);
    REQUIRE(engine->stats().messages_sent == 0);
}

TEST_CASE("Gossip Round Marks Only Successful Targets Healthy", "[gossip][round]") {
    GossipFixture f;
    f.add_peers(3);
    f.transport->set_unreachable("p1");
    auto engine = f.make();

    auto round = engine->run_round();
    REQUIRE(round.status == RoundStatus::Completed);
    REQUIRE(round.targets.size() == 3);
    REQUIRE(round.results.size() == 3);

    REQUIRE(f.table->health(peer_id(0)) == PeerHealth::Healthy);
    REQUIRE(f.table->health(peer_id(1)) == PeerHealth::Unknown);
    REQUIRE(f.table->health(peer_id(2)) == PeerHealth::Healthy);

    for (const auto& result : round.results) {
        REQUIRE(result.success == (result.peer_id != peer_id(1)));
    }

    auto stats = engine->stats();
    REQUIRE(stats.rounds_initiated == 1);
    REQUIRE(stats.rounds_completed == 1);
    REQUIRE(stats.messages_sent == 2);
    REQUIRE(stats.errors == 1);
    REQUIRE(stats.last_gossip_time == static_cast<double>(f.clock.now()) / 1000.0);
}

TEST_CASE("Gossip Round With Bounded Concurrency", "[gossip][round]") {
    GossipFixture f;
    f.gossip_config.fanout = 8;
    f.gossip_config.max_concurrent_exchanges = 2;
    f.add_peers(8);
    auto engine = f.make();

    f.transport->delay_ms = 50;

    auto round = engine->run_round();
    REQUIRE(round.results.size() == 8);
    for (const auto& result : round.results) {
        REQUIRE(result.success);
    }
    REQUIRE(f.transport->fetched_hosts.size() == 8);
    REQUIRE(f.transport->max_in_flight.load() > 1);
    REQUIRE(f.transport->max_in_flight.load() <= 2);
}

TEST_CASE("Gossip Fold Keeps Record Stored During Resolve", "[gossip][exchange][concurrency]") {
    GossipFixture f;
    f.add_peers(1);
    f.transport->set_peers("p0", {"x.agents.local"});

    auto real = make_agent("x.agents.local", {"chat"});
    real.host = "10.0.0.7";
    real.port = "9001";
    real.source = Provenance::Registry;

    // The refresh loop stores the directory record while gossip is still resolving
    f.dns->on_resolve = [&](const std::string& id) {
        if (id == "x.agents.local") f.table->upsert(id, real);
    };
    auto engine = f.make();

    auto result = engine->exchange_with(peer_id(0));
    REQUIRE(result.success);
    REQUIRE(result.new_peers.empty());

    auto entry = f.table->entry("x.agents.local");
    REQUIRE(entry.has_value());
    REQUIRE_FALSE(entry->record.needs_resolution);
    REQUIRE(entry->record.host == "10.0.0.7");
    REQUIRE(entry->address == PeerAddress{"10.0.0.7", 9001});
    REQUIRE(engine->stats().new_peers_discovered == 0);
}

TEST_CASE("Gossip Round Races Refresh Loop", "[gossip][round][concurrency]") {
    GossipFixture f;
    f.add_peers(1);
    f.transport->set_peers("p0", {"x.agents.local"});
    f.dns->delay_ms = 200;
    auto engine = f.make();

    auto real = make_agent("x.agents.local");
    real.host = "10.0.0.7";
    real.port = "9001";

    std::thread writer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        f.table->upsert("x.agents.local", real);
    });
    engine->run_round();
    writer.join();

    auto entry = f.table->entry("x.agents.local");
    REQUIRE(entry.has_value());
    REQUIRE_FALSE(entry->record.needs_resolution);
    REQUIRE(entry->address == PeerAddress{"10.0.0.7", 9001});
}

TEST_CASE("Gossip Counts A Peer Learned From Two Targets Once", "[gossip][round][concurrency]") {
    GossipFixture f;
    f.gossip_config.fanout = 2;
    f.gossip_config.max_concurrent_exchanges = 2;
    f.add_peers(2);
    f.transport->set_peers("p0", {"x.agents.local"});
    f.transport->set_peers("p1", {"x.agents.local"});
    f.dns->delay_ms = 100;
    auto engine = f.make();

    auto round = engine->run_round();
    REQUIRE(round.results.size() == 2);

    size_t reported = 0;
    for (const auto& result : round.results) {
        REQUIRE(result.success);
        reported += result.new_peers.size();
    }
    REQUIRE(reported == 1);
    REQUIRE(f.table->size() == 3);
    REQUIRE(engine->stats().new_peers_discovered == 1);
}

TEST_CASE("Gossip Round Without Peers", "[gossip][round]") {
    GossipFixture f;
    auto engine = f.make();

    auto round = engine->run_round();
    REQUIRE(round.status == RoundStatus::NoPeers);
    REQUIRE(round.targets.empty());

    auto stats = engine->stats();
    REQUIRE(stats.rounds_initiated == 1);
    REQUIRE(stats.rounds_completed == 0);
    REQUIRE(stats.last_gossip_time == 0.0);
}

TEST_CASE("Gossip Round Evicts Stale Peers", "[gossip][round][evict]") {
    GossipFixture f;
    f.peer_config.peer_ttl_sec = 100;
    f.add_peers(2);
    f.clock.advance_sec(101);
    f.table->upsert(peer_id(5), make_agent(peer_id(5)));
    auto engine = f.make();

    auto round = engine->run_round();
    std::sort(round.stale_removed.begin(), round.stale_removed.end());
    REQUIRE(round.stale_removed == std::vector<std::string>{peer_id(0), peer_id(1)});
    REQUIRE(round.targets == std::vector<std::string>{peer_id(5)});
    REQUIRE(engine->stats().stale_peers_removed == 2);
}

TEST_CASE("Gossip Inbound Push", "[gossip][inbound]") {
    GossipFixture f;
    f.add_peers(1);
    f.dns->add(make_agent("dns-only.agents.local"));
    auto engine = f.make();

    auto result = engine->receive_peers({peer_id(0), kSelf, "dns-only.agents.local", "new.agents.local"},
                                        "peer-push");
    std::sort(result.added_peers.begin(), result.added_peers.end());
    REQUIRE(result.added_peers == std::vector<std::string>{"dns-only.agents.local", "new.agents.local"});
    REQUIRE(result.total_peers == 3);

    REQUIRE(f.table->get("dns-only.agents.local")->source == Provenance::Dns);
    REQUIRE(f.table->get("new.agents.local")->discovered_via == "peer-push");

    auto stats = engine->stats();
    REQUIRE(stats.messages_received == 1);
    REQUIRE(stats.peers_received == 4);
    REQUIRE(stats.new_peers_discovered == 2);
}

TEST_CASE("Gossip Stats JSON", "[gossip][stats]") {
    GossipStats stats;
    stats.rounds_initiated = 4;
    stats.errors = 1;
    auto doc = stats_to_json(stats);
    REQUIRE(doc["rounds_initiated"] == 4);
    REQUIRE(doc["errors"] == 1);
    REQUIRE(doc["last_gossip_time"] == 0.0);
    REQUIRE(doc.size() == 10);
}

TEST_CASE("Gossip Loop Start And Stop", "[gossip][lifecycle]") {
    GossipFixture f;
    auto engine = f.make();

    REQUIRE(engine->start());
    REQUIRE(engine->is_running());
    REQUIRE_FALSE(engine->start());

    // The first round runs immediately
    for (int i = 0; i < 50 && engine->stats().rounds_initiated == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    REQUIRE(engine->stats().rounds_initiated >= 1);

    REQUIRE(engine->stop());
    REQUIRE_FALSE(engine->is_running());
    REQUIRE_FALSE(engine->stop());

    REQUIRE(engine->start());
    REQUIRE(engine->stop());
}
