#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "agentmesh/discovery/dns_resolver.h"

using namespace agentmesh;

TEST_CASE("TXT Rdata Splitting", "[dns][txt]") {
    const unsigned char rdata[] = {
        10, 'c', 'a', 'p', 's', '=', 'c', 'h', 'a', 't', ',',
        5, 'v', 'e', 'r', '=', '2',
        0
    };
    auto parts = split_txt_rdata(rdata, sizeof(rdata));
    REQUIRE(parts == std::vector<std::string>{"caps=chat,", "ver=2", ""});

    // Truncated trailing string is dropped
    const unsigned char truncated[] = {3, 'a', 'b', 'c', 9, 'x'};
    REQUIRE(split_txt_rdata(truncated, sizeof(truncated)) == std::vector<std::string>{"abc"});
    REQUIRE(split_txt_rdata(truncated, 0).empty());
}

TEST_CASE("DNS Record From SRV And TXT", "[dns][record]") {
    auto record = build_dns_record("alpha.agents.local", "alpha.example", 8080,
                                   {"caps=chat, search", "desc=Helpful agent", "ver=2.1", "other=x"});
    REQUIRE(record.id == "alpha.agents.local");
    REQUIRE(record.host == "alpha.example");
    REQUIRE(record.port == "8080");
    REQUIRE(record.capabilities == std::vector<std::string>{"chat", "search"});
    REQUIRE(record.description == "Helpful agent");
    REQUIRE(record.version == "2.1");
    REQUIRE(record.source == Provenance::Dns);
}

TEST_CASE("DNS Record Defaults Without TXT", "[dns][record]") {
    auto record = build_dns_record("beta.agents.local", "beta", 9000, {});
    REQUIRE(record.version == "1.0");
    REQUIRE(record.capabilities.empty());
    REQUIRE(record.description.empty());
    REQUIRE(record.port == "9000");
}

TEST_CASE("DNS Resolver Nameserver Selection", "[dns][config]") {
    DnsConfig config;
    config.server = "10.0.0.53";
    config.port = 5353;
    DnsResolver resolver(config);
    REQUIRE(resolver.nameserver() == "10.0.0.53");

    DnsResolver system_resolver(DnsConfig{});
    REQUIRE(system_resolver.nameserver().empty());
}

TEST_CASE("DNS Service Label", "[dns]") {
    REQUIRE(std::string(kAgentServiceLabel) + "alpha.agents.local" == "_llm-agent._tcp.alpha.agents.local");
}
