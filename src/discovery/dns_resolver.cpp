#include "agentmesh/discovery/dns_resolver.h"
#include "agentmesh/base/config.h"
#include "agentmesh/base/logger.h"
#include <array>
#include <cstring>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <netinet/in.h>
#include <resolv.h>

namespace agentmesh {

namespace {

// Owns one resolver state for the duration of a lookup
class ResolverState {
public:
    ResolverState() {
        std::memset(&state_, 0, sizeof(state_));
        ok_ = (res_ninit(&state_) == 0);
    }
    ~ResolverState() {
        if (ok_) res_nclose(&state_);
    }
    ResolverState(const ResolverState&) = delete;
    ResolverState& operator=(const ResolverState&) = delete;

    bool ok() const { return ok_; }
    struct __res_state* get() { return &state_; }

private:
    struct __res_state state_;
    bool ok_ = false;
};

std::string resolve_ipv4(const std::string& server) {
    struct in_addr addr;
    if (inet_pton(AF_INET, server.c_str(), &addr) == 1) {
        return server;
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    struct addrinfo* result = nullptr;
    if (getaddrinfo(server.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        Logger::instance().warning("Could not resolve DNS server {}, using 127.0.0.1", server);
        return "127.0.0.1";
    }

    char buf[INET_ADDRSTRLEN] = {0};
    auto* sin = reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
    inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    freeaddrinfo(result);
    Logger::instance().info("Resolved DNS server {} to IP: {}", server, buf);
    return buf;
}

} // anonymous namespace

struct DnsResolver::Impl {
    DnsConfig config;
    std::string nameserver_ip;

    Impl(const DnsConfig& cfg) : config(cfg) {
        if (!cfg.server.empty()) {
            nameserver_ip = resolve_ipv4(cfg.server);
        }
    }

    // Points the resolver at the configured server instead of resolv.conf
    void configure(struct __res_state* state) const {
        state->retrans = static_cast<int>(config.timeout_sec);
        state->retry = 1;
        if (nameserver_ip.empty()) return;

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(config.port);
        inet_pton(AF_INET, nameserver_ip.c_str(), &addr.sin_addr);
        state->nsaddr_list[0] = addr;
        state->nscount = 1;
    }

    std::optional<std::pair<std::string, uint16_t>> lookup_srv(struct __res_state* state,
                                                               const std::string& name) const {
        std::array<unsigned char, 4096> buffer{};
        int len = res_nquery(state, name.c_str(), ns_c_in, ns_t_srv, buffer.data(), buffer.size());
        if (len < 0) {
            Logger::instance().debug("No SRV answer for " + name);
            return std::nullopt;
        }

        ns_msg handle;
        if (ns_initparse(buffer.data(), len, &handle) < 0) {
            Logger::instance().warning("Failed to parse SRV response for " + name);
            return std::nullopt;
        }

        int count = ns_msg_count(handle, ns_s_an);
        for (int i = 0; i < count; ++i) {
            ns_rr rr;
            if (ns_parserr(&handle, ns_s_an, i, &rr) != 0) continue;
            if (ns_rr_type(rr) != ns_t_srv || ns_rr_rdlen(rr) < 7) continue;

            // priority(2) weight(2) port(2) target
            const unsigned char* rdata = ns_rr_rdata(rr);
            uint16_t port = static_cast<uint16_t>((rdata[4] << 8) | rdata[5]);

            char target[NS_MAXDNAME] = {0};
            if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), rdata + 6,
                          target, sizeof(target)) < 0) {
                continue;
            }

            std::string host(target);
            while (!host.empty() && host.back() == '.') host.pop_back();
            return std::make_pair(host, port);
        }
        return std::nullopt;
    }

    std::vector<std::string> lookup_txt(struct __res_state* state, const std::string& name) const {
        std::vector<std::string> tokens;
        std::array<unsigned char, 4096> buffer{};
        int len = res_nquery(state, name.c_str(), ns_c_in, ns_t_txt, buffer.data(), buffer.size());
        if (len < 0) {
            return tokens;
        }

        ns_msg handle;
        if (ns_initparse(buffer.data(), len, &handle) < 0) {
            Logger::instance().warning("Failed to parse TXT response for " + name);
            return tokens;
        }

        int count = ns_msg_count(handle, ns_s_an);
        for (int i = 0; i < count; ++i) {
            ns_rr rr;
            if (ns_parserr(&handle, ns_s_an, i, &rr) != 0) continue;
            if (ns_rr_type(rr) != ns_t_txt) continue;
            auto parts = split_txt_rdata(ns_rr_rdata(rr), ns_rr_rdlen(rr));
            tokens.insert(tokens.end(), parts.begin(), parts.end());
        }
        return tokens;
    }
};

std::vector<std::string> split_txt_rdata(const unsigned char* rdata, size_t length) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < length) {
        size_t txt_len = rdata[pos];
        ++pos;
        if (pos + txt_len > length) break;
        parts.emplace_back(reinterpret_cast<const char*>(rdata + pos), txt_len);
        pos += txt_len;
    }
    return parts;
}

AgentRecord build_dns_record(const std::string& id,
                             const std::string& host,
                             uint16_t port,
                             const std::vector<std::string>& txt_tokens) {
    AgentRecord record;
    record.id = id;
    record.host = host;
    record.port = std::to_string(port);
    record.version = "1.0";
    record.source = Provenance::Dns;

    for (const auto& token : txt_tokens) {
        if (token.rfind("caps=", 0) == 0) {
            record.capabilities = split_list(token.substr(5));
        } else if (token.rfind("desc=", 0) == 0) {
            record.description = token.substr(5);
        } else if (token.rfind("ver=", 0) == 0) {
            record.version = token.substr(4);
        }
    }
    return record;
}

DnsResolver::DnsResolver(const DnsConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    Logger::instance().info("Initialized DNS resolver with nameserver: {}:{}",
                            impl_->nameserver_ip.empty() ? std::string("system") : impl_->nameserver_ip,
                            config.port);
}

DnsResolver::~DnsResolver() = default;

std::string DnsResolver::nameserver() const {
    return impl_->nameserver_ip;
}

std::optional<AgentRecord> DnsResolver::resolve_agent(const std::string& id) {
    ResolverState state;
    if (!state.ok()) {
        Logger::instance().error("res_ninit failed while resolving " + id);
        return std::nullopt;
    }
    impl_->configure(state.get());

    std::string service_name = std::string(kAgentServiceLabel) + id;
    auto srv = impl_->lookup_srv(state.get(), service_name);
    if (!srv) {
        Logger::instance().warning("No SRV record found for " + id);
        return std::nullopt;
    }

    auto tokens = impl_->lookup_txt(state.get(), service_name);
    return build_dns_record(id, srv->first, srv->second, tokens);
}

} // namespace agentmesh
