#include "agentmesh/p2p/peer_table.h"
#include "agentmesh/base/logger.h"
#include <cctype>
#include <mutex>
#include <unordered_map>

namespace agentmesh {

namespace {

// Parses a decimal port in [1, 65535]; 0 means "not set"
std::optional<uint16_t> parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5) return std::nullopt;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    unsigned long value = std::stoul(text);
    if (value > 65535) return std::nullopt;
    return static_cast<uint16_t>(value);
}

} // anonymous namespace

std::string to_string(PeerHealth health) {
    switch (health) {
        case PeerHealth::Healthy: return "healthy";
        case PeerHealth::Unhealthy: return "unhealthy";
        default: return "unknown";
    }
}

bool UsablePeerPolicy::usable(const PeerEntry& entry, uint64_t now_ms) const {
    if (entry.health == PeerHealth::Healthy) return true;
    if (entry.health == PeerHealth::Unknown && trust_unchecked) {
        uint64_t window_ms = static_cast<uint64_t>(recent_window_sec) * 1000;
        return now_ms < entry.last_seen_ms || now_ms - entry.last_seen_ms < window_ms;
    }
    return false;
}

PeerAddress resolve_peer_address(const std::string& id, const AgentRecord& record) {
    PeerAddress address;
    address.host = record.host;

    if (!record.port.empty()) {
        auto port = parse_port(record.port);
        if (port) {
            address.port = *port;
        } else {
            Logger::instance().warning("Invalid port in peer info for {}: {}", id, record.port);
        }
    }

    if (address.host.empty()) {
        auto rest = record.interfaces.find("rest");
        if (rest != record.interfaces.end()) {
            const std::string& url = rest->second;
            size_t scheme_end = url.find("://");
            if (scheme_end != std::string::npos) {
                std::string netloc = url.substr(scheme_end + 3);
                netloc = netloc.substr(0, netloc.find_first_of("/?#"));
                size_t colon = netloc.find(':');
                address.host = netloc.substr(0, colon);
                if (colon != std::string::npos && address.port == 0) {
                    auto port = parse_port(netloc.substr(colon + 1));
                    if (port) {
                        address.port = *port;
                    } else {
                        Logger::instance().warning("Invalid port in REST interface for " + id);
                    }
                }
            }
        }
    }

    if (address.host.empty()) {
        size_t dot = id.find('.');
        if (dot != std::string::npos) {
            address.host = id.substr(0, dot);
        }
    }

    if (address.port == 0) {
        address.port = kDefaultPeerPort;
    }
    return address;
}

struct PeerTable::Impl {
    std::string self_id;
    std::shared_ptr<PeerTransport> transport;
    ClockFn clock;

    mutable std::mutex mutex;
    std::unordered_map<std::string, PeerEntry> peers;
    UsablePeerPolicy policy;

    Impl(std::string id, std::shared_ptr<PeerTransport> t, ClockFn clk)
        : self_id(std::move(id)), transport(std::move(t)), clock(std::move(clk)) {}
};

PeerTable::PeerTable(std::string self_id,
                     std::shared_ptr<PeerTransport> transport,
                     ClockFn clock)
    : impl_(std::make_unique<Impl>(std::move(self_id), std::move(transport), std::move(clock))) {}

PeerTable::~PeerTable() = default;

const std::string& PeerTable::self_id() const {
    return impl_->self_id;
}

bool PeerTable::upsert(const std::string& id, const AgentRecord& record) {
    if (id.empty() || id == impl_->self_id) {
        return false;
    }

    // Address derivation may log; keep it outside the lock
    PeerAddress address = resolve_peer_address(id, record);
    uint64_t now = impl_->clock();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->peers.find(id);
    if (it == impl_->peers.end()) {
        PeerEntry entry;
        entry.id = id;
        entry.record = record;
        entry.health = PeerHealth::Unknown;
        entry.last_seen_ms = now;
        entry.address = std::move(address);
        impl_->peers.emplace(id, std::move(entry));
        Logger::instance().debug("Added peer {} ({})", id, to_string(record.source));
    } else {
        it->second.record = record;
        it->second.last_seen_ms = now;
        it->second.address = std::move(address);
    }
    return true;
}

bool PeerTable::insert_if_absent(const std::string& id, const AgentRecord& record) {
    if (id.empty() || id == impl_->self_id) {
        return false;
    }

    PeerAddress address = resolve_peer_address(id, record);
    uint64_t now = impl_->clock();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->peers.count(id)) {
        return false;
    }

    PeerEntry entry;
    entry.id = id;
    entry.record = record;
    entry.health = PeerHealth::Unknown;
    entry.last_seen_ms = now;
    entry.address = std::move(address);
    impl_->peers.emplace(id, std::move(entry));
    Logger::instance().debug("Added peer {} ({})", id, to_string(record.source));
    return true;
}

bool PeerTable::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    bool removed = impl_->peers.erase(id) > 0;
    if (removed) {
        Logger::instance().debug("Removed peer " + id);
    }
    return removed;
}

std::optional<AgentRecord> PeerTable::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->peers.find(id);
    if (it == impl_->peers.end()) return std::nullopt;
    return it->second.record;
}

std::optional<PeerEntry> PeerTable::entry(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->peers.find(id);
    if (it == impl_->peers.end()) return std::nullopt;
    return it->second;
}

std::optional<PeerHealth> PeerTable::health(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->peers.find(id);
    if (it == impl_->peers.end()) return std::nullopt;
    return it->second.health;
}

std::vector<PeerEntry> PeerTable::all() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<PeerEntry> entries;
    entries.reserve(impl_->peers.size());
    for (const auto& [id, entry] : impl_->peers) {
        entries.push_back(entry);
    }
    return entries;
}

std::vector<std::string> PeerTable::ids() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<std::string> out;
    out.reserve(impl_->peers.size());
    for (const auto& [id, entry] : impl_->peers) {
        out.push_back(id);
    }
    return out;
}

bool PeerTable::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->peers.count(id) > 0;
}

size_t PeerTable::size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->peers.size();
}

std::vector<PeerEntry> PeerTable::usable_peers() const {
    uint64_t now = impl_->clock();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::vector<PeerEntry> usable;
    for (const auto& [id, entry] : impl_->peers) {
        if (impl_->policy.usable(entry, now)) {
            usable.push_back(entry);
        }
    }

    if (usable.empty() && impl_->policy.fallback_to_all && !impl_->peers.empty()) {
        for (const auto& [id, entry] : impl_->peers) {
            usable.push_back(entry);
        }
    }
    return usable;
}

PeerHealth PeerTable::check_health(const std::string& id) {
    if (!impl_->transport) {
        return PeerHealth::Unknown;
    }

    PeerAddress address;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->peers.find(id);
        if (it == impl_->peers.end()) return PeerHealth::Unknown;
        address = it->second.address;
    }
    if (address.host.empty()) {
        Logger::instance().warning("Cannot determine host for peer " + id);
        return PeerHealth::Unknown;
    }

    auto status = impl_->transport->check_health(address);
    PeerHealth result = (status && *status >= 200 && *status < 300)
        ? PeerHealth::Healthy : PeerHealth::Unhealthy;

    uint64_t now = impl_->clock();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->peers.find(id);
    if (it != impl_->peers.end()) {
        it->second.health = result;
        if (result == PeerHealth::Healthy) {
            it->second.last_seen_ms = now;
        }
    }
    Logger::instance().debug("Checked peer {}: {}", id, to_string(result));
    return result;
}

void PeerTable::update_health(const std::string& id, PeerHealth health) {
    uint64_t now = impl_->clock();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->peers.find(id);
    if (it == impl_->peers.end()) return;
    it->second.health = health;
    it->second.last_seen_ms = now;
}

std::vector<std::string> PeerTable::evict_stale(uint32_t ttl_sec) {
    uint64_t now = impl_->clock();
    uint64_t ttl_ms = static_cast<uint64_t>(ttl_sec) * 1000;

    std::vector<std::string> removed;
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (auto it = impl_->peers.begin(); it != impl_->peers.end();) {
        if (now > it->second.last_seen_ms && now - it->second.last_seen_ms > ttl_ms) {
            removed.push_back(it->first);
            it = impl_->peers.erase(it);
        } else {
            ++it;
        }
    }

    if (!removed.empty()) {
        Logger::instance().info("Removed {} stale peers", removed.size());
    }
    return removed;
}

void PeerTable::set_policy(const UsablePeerPolicy& policy) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->policy = policy;
}

UsablePeerPolicy PeerTable::policy() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->policy;
}

} // namespace agentmesh
