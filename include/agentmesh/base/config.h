#ifndef AGENTMESH_BASE_CONFIG_H
#define AGENTMESH_BASE_CONFIG_H

#include <string>
#include <cstdint>
#include <vector>
#include <map>

namespace agentmesh {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, file
    std::string file_path = "";
};

// Identity and advertised metadata of the local agent
struct NodeConfig {
    std::string agent_id;           // defaults to {hostname}.agents.local
    std::string name = "Agent";
    std::string description = "Autonomous agent node";
    std::vector<std::string> capabilities;
    std::string host;               // advertised host, defaults to hostname
    uint16_t port = 8000;
    std::string bind_address = "0.0.0.0";
    std::string version = "0.1.0";
    std::vector<std::string> protocols = {"rest-json"};
    std::string provider;
    std::string owner;
};

// Directory service connection
struct RegistryConfig {
    std::string url = "http://registry:5000";
    uint32_t request_timeout_sec = 10;
    uint32_t heartbeat_timeout_sec = 5;
    bool unregister_on_stop = true;
};

// Name service used for fallback resolution
struct DnsConfig {
    std::string server;             // empty means system resolver
    uint16_t port = 53;
    uint32_t timeout_sec = 2;
};

struct DiscoveryConfig {
    uint32_t cache_ttl_sec = 600;
    uint32_t refresh_interval_sec = 300;
    std::vector<std::string> methods = {"registry", "dns"};
};

struct PeerConfig {
    uint32_t peer_ttl_sec = 3600;
    uint32_t health_timeout_sec = 2;
    uint32_t recent_window_sec = 300;
};

struct GossipConfig {
    bool enable = true;
    uint32_t interval_sec = 60;
    uint32_t fanout = 3;
    uint32_t max_peers_per_message = 10;
    uint32_t max_concurrent_exchanges = 5;
    uint32_t exchange_timeout_sec = 5;
    uint32_t startup_delay_sec = 10;
};

// Registration and heartbeat state machine timing
struct RegistrationConfig {
    uint32_t heartbeat_interval_sec = 60;
    uint32_t cooldown_sec = 10;
    uint32_t max_attempts = 5;
    uint32_t backoff_sec = 60;
    uint32_t settle_sec = 2;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    RegistryConfig registry;
    DnsConfig dns;
    DiscoveryConfig discovery;
    PeerConfig peers;
    GossipConfig gossip;
    RegistrationConfig registration;
};

class Config {
public:
    static Config& instance();

    // Load configuration from file (INI, or JSON by extension)
    bool load_from_file(const std::string& path);

    // Load configuration from environment variables
    bool load_from_env();

    // Parse command line arguments and override config
    bool parse_command_line(int argc, char* argv[]);

    // Fill identity fields that depend on the host
    void apply_defaults();

    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    const std::string& get_config_file() const { return config_file_; }

    // True when the command line asked for --help or --version
    bool exit_requested() const { return exit_requested_; }

    bool validate() const;

    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    bool load_ini(const std::string& path);
    bool load_json(const std::string& path);
    void apply_sections(const std::map<std::string, std::map<std::string, std::string>>& sections);
    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
    bool exit_requested_ = false;
};

// Comma separated list helper shared by the INI, env and CLI layers
std::vector<std::string> split_list(const std::string& value);

} // namespace agentmesh

#endif // AGENTMESH_BASE_CONFIG_H
