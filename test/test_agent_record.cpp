#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "agentmesh/discovery/agent_record.h"

using namespace agentmesh;
using json = nlohmann::json;

TEST_CASE("Agent Record From Directory JSON", "[record][json]") {
    json doc = json::parse(R"({
        "id": "alpha.agents.local",
        "name": "Alpha",
        "description": "First agent",
        "capabilities": ["chat", "search", 7],
        "interfaces": {"rest": "http://alpha:8000/v1"},
        "endpoints": {"peers": "/peers"},
        "port": 8001,
        "version": "1.2",
        "protocols": ["rest-json"],
        "model_info": {"provider": "acme"},
        "owner": "team",
        "last_update": 1700000000.5
    })");

    auto record = agent_from_json(doc);
    REQUIRE(record.has_value());
    REQUIRE(record->id == "alpha.agents.local");
    REQUIRE(record->name == "Alpha");
    REQUIRE(record->capabilities == std::vector<std::string>{"chat", "search"});
    REQUIRE(record->interfaces.at("rest") == "http://alpha:8000/v1");
    REQUIRE(record->endpoints.at("peers") == "/peers");
    REQUIRE(record->port == "8001");
    REQUIRE(record->provider == "acme");
    REQUIRE(record->last_update == 1700000000.5);
    REQUIRE(record->source == Provenance::Unknown);
}

TEST_CASE("Agent Record Rejects Malformed JSON", "[record][json]") {
    REQUIRE_FALSE(agent_from_json(json::array()).has_value());
    REQUIRE_FALSE(agent_from_json(json{{"name", "no id"}}).has_value());
    REQUIRE_FALSE(agent_from_json(json{{"id", ""}}).has_value());
    REQUIRE_FALSE(agent_from_json(json{{"id", 5}}).has_value());

    auto minimal = agent_from_json(json{{"id", "x.agents.local"}, {"port", "abc"}});
    REQUIRE(minimal.has_value());
    REQUIRE(minimal->port == "abc");
    REQUIRE(minimal->capabilities.empty());
}

TEST_CASE("Agent Record To JSON", "[record][json]") {
    AgentRecord record;
    record.id = "alpha.agents.local";
    record.name = "Alpha";
    record.host = "alpha";
    record.port = "8000";
    record.provider = "acme";
    record.source = Provenance::Registry;

    auto doc = agent_to_json(record);
    REQUIRE(doc["id"] == "alpha.agents.local");
    REQUIRE(doc["port"] == 8000);
    REQUIRE(doc["model_info"]["provider"] == "acme");
    REQUIRE(doc["source"] == "registry");
    REQUIRE_FALSE(doc.contains("needs_resolution"));

    auto back = agent_from_json(doc);
    REQUIRE(back->host == "alpha");
    REQUIRE(back->port == "8000");

    AgentRecord unknown;
    unknown.id = "u";
    REQUIRE_FALSE(agent_to_json(unknown).contains("source"));
    REQUIRE_FALSE(agent_to_json(unknown).contains("port"));
}

TEST_CASE("Gossip Placeholder Record", "[record][placeholder]") {
    auto record = make_placeholder("beta.agents.local", "alpha.agents.local");
    REQUIRE(record.id == "beta.agents.local");
    REQUIRE(record.needs_resolution);
    REQUIRE(record.discovered_via == "alpha.agents.local");
    REQUIRE(record.source == Provenance::Gossip);

    auto doc = agent_to_json(record);
    REQUIRE(doc["needs_resolution"] == true);
    REQUIRE(doc["discovered_via"] == "alpha.agents.local");
    REQUIRE(doc["source"] == "gossip");
}

TEST_CASE("Search Criteria Matching", "[record][search]") {
    AgentRecord record;
    record.id = "alpha.agents.local";
    record.name = "Alpha Helper";
    record.description = "Summarizes Documents";
    record.capabilities = {"chat", "summarize"};
    record.protocols = {"rest-json"};
    record.provider = "acme";

    SearchCriteria empty;
    REQUIRE(empty.matches(record));

    SearchCriteria caps;
    caps.capabilities = {"chat", "summarize"};
    REQUIRE(caps.matches(record));
    caps.capabilities.push_back("vision");
    REQUIRE_FALSE(caps.matches(record));

    SearchCriteria text;
    text.query = "documents";
    REQUIRE(text.matches(record));
    text.query = "HELPER";
    REQUIRE(text.matches(record));
    text.query = "translator";
    REQUIRE_FALSE(text.matches(record));

    SearchCriteria proto;
    proto.protocol = "grpc";
    REQUIRE_FALSE(proto.matches(record));
    proto.protocol = "rest-json";
    REQUIRE(proto.matches(record));

    SearchCriteria provider;
    provider.provider = "other";
    REQUIRE_FALSE(provider.matches(record));
}
