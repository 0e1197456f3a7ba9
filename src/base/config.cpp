#include "agentmesh/base/config.h"
#include "agentmesh/base/error_code.h"
#include "agentmesh/base/http_client.h"
#include "agentmesh/base/logger.h"
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <limits>
#include <unistd.h>

using json = nlohmann::json;

namespace agentmesh {

namespace {

using SectionMap = std::map<std::string, std::map<std::string, std::string>>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
void parse_ini_file(const std::string& path, SectionMap& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
}

// Flattens {"section": {"key": value}} into the same shape the INI parser produces
void flatten_json(const json& doc, SectionMap& sections) {
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_object()) continue;
        auto& section = sections[it.key()];
        for (auto kv = it.value().begin(); kv != it.value().end(); ++kv) {
            const auto& v = kv.value();
            if (v.is_string()) {
                section[kv.key()] = v.get<std::string>();
            } else if (v.is_array()) {
                std::string joined;
                for (const auto& item : v) {
                    if (!joined.empty()) joined += ",";
                    joined += item.is_string() ? item.get<std::string>() : item.dump();
                }
                section[kv.key()] = joined;
            } else {
                section[kv.key()] = v.dump();
            }
        }
    }
}

uint32_t to_uint(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        unsigned long parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed > std::numeric_limits<uint32_t>::max()) {
            throw std::out_of_range(value);
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::exception&) {
        throw AgentMeshError(ErrorCode::ConfigError, "invalid value for " + key + ": '" + value + "'");
    }
}

uint16_t to_port(const std::string& key, const std::string& value) {
    uint32_t port = to_uint(key, value);
    if (port > std::numeric_limits<uint16_t>::max()) {
        throw AgentMeshError(ErrorCode::ConfigError, "port out of range for " + key + ": " + value);
    }
    return static_cast<uint16_t>(port);
}

bool to_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

std::string local_hostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "localhost";
    }
    return buf;
}

} // anonymous namespace

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string::npos) end = value.size();
        std::string item = trim(value.substr(start, end - start));
        if (!item.empty()) items.push_back(item);
        start = end + 1;
    }
    return items;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: " + path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: " + path);
        return false;
    }

    config_file_ = path;

    try {
        std::string ext = std::filesystem::path(path).extension().string();
        bool ok = (ext == ".json") ? load_json(path) : load_ini(path);
        if (ok) {
            Logger::instance().info("Config loaded successfully from: " + path);
        }
        return ok;
    } catch (const AgentMeshError& e) {
        Logger::instance().error("Failed to load config {}: {}", path, e.what());
        return false;
    }
}

bool Config::load_ini(const std::string& path) {
    SectionMap sections;
    parse_ini_file(path, sections);
    apply_sections(sections);
    return true;
}

bool Config::load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::instance().error("Cannot open config file: " + path);
        return false;
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::exception& e) {
        Logger::instance().error("Invalid JSON in {}: {}", path, e.what());
        return false;
    }
    if (!doc.is_object()) {
        Logger::instance().error("JSON config root must be an object: " + path);
        return false;
    }

    SectionMap sections;
    flatten_json(doc, sections);
    apply_sections(sections);
    return true;
}

void Config::apply_sections(const SectionMap& sections) {
    auto section = [&sections](const std::string& name) -> const std::map<std::string, std::string>* {
        auto it = sections.find(name);
        return it == sections.end() ? nullptr : &it->second;
    };

    if (auto* s = section("log")) {
        for (const auto& [key, value] : *s) {
            if (key == "level") config_.log.level = value;
            else if (key == "output") config_.log.output = value;
            else if (key == "file_path") config_.log.file_path = value;
        }
    }

    if (auto* s = section("node")) {
        for (const auto& [key, value] : *s) {
            if (key == "agent_id") config_.node.agent_id = value;
            else if (key == "name") config_.node.name = value;
            else if (key == "description") config_.node.description = value;
            else if (key == "capabilities") config_.node.capabilities = split_list(value);
            else if (key == "host") config_.node.host = value;
            else if (key == "port") config_.node.port = to_port("node.port", value);
            else if (key == "bind_address") config_.node.bind_address = value;
            else if (key == "version") config_.node.version = value;
            else if (key == "protocols") config_.node.protocols = split_list(value);
            else if (key == "provider") config_.node.provider = value;
            else if (key == "owner") config_.node.owner = value;
        }
    }

    if (auto* s = section("registry")) {
        for (const auto& [key, value] : *s) {
            if (key == "url") config_.registry.url = value;
            else if (key == "request_timeout_sec") config_.registry.request_timeout_sec = to_uint("registry." + key, value);
            else if (key == "heartbeat_timeout_sec") config_.registry.heartbeat_timeout_sec = to_uint("registry." + key, value);
            else if (key == "unregister_on_stop") config_.registry.unregister_on_stop = to_bool(value);
        }
    }

    if (auto* s = section("dns")) {
        for (const auto& [key, value] : *s) {
            if (key == "server") config_.dns.server = value;
            else if (key == "port") config_.dns.port = to_port("dns.port", value);
            else if (key == "timeout_sec") config_.dns.timeout_sec = to_uint("dns." + key, value);
        }
    }

    if (auto* s = section("discovery")) {
        for (const auto& [key, value] : *s) {
            if (key == "cache_ttl_sec") config_.discovery.cache_ttl_sec = to_uint("discovery." + key, value);
            else if (key == "refresh_interval_sec") config_.discovery.refresh_interval_sec = to_uint("discovery." + key, value);
            else if (key == "methods") config_.discovery.methods = split_list(value);
        }
    }

    if (auto* s = section("peers")) {
        for (const auto& [key, value] : *s) {
            if (key == "peer_ttl_sec") config_.peers.peer_ttl_sec = to_uint("peers." + key, value);
            else if (key == "health_timeout_sec") config_.peers.health_timeout_sec = to_uint("peers." + key, value);
            else if (key == "recent_window_sec") config_.peers.recent_window_sec = to_uint("peers." + key, value);
        }
    }

    if (auto* s = section("gossip")) {
        for (const auto& [key, value] : *s) {
            if (key == "enable") config_.gossip.enable = to_bool(value);
            else if (key == "interval_sec") config_.gossip.interval_sec = to_uint("gossip." + key, value);
            else if (key == "fanout") config_.gossip.fanout = to_uint("gossip." + key, value);
            else if (key == "max_peers_per_message") config_.gossip.max_peers_per_message = to_uint("gossip." + key, value);
            else if (key == "max_concurrent_exchanges") config_.gossip.max_concurrent_exchanges = to_uint("gossip." + key, value);
            else if (key == "exchange_timeout_sec") config_.gossip.exchange_timeout_sec = to_uint("gossip." + key, value);
            else if (key == "startup_delay_sec") config_.gossip.startup_delay_sec = to_uint("gossip." + key, value);
        }
    }

    if (auto* s = section("registration")) {
        for (const auto& [key, value] : *s) {
            if (key == "heartbeat_interval_sec") config_.registration.heartbeat_interval_sec = to_uint("registration." + key, value);
            else if (key == "cooldown_sec") config_.registration.cooldown_sec = to_uint("registration." + key, value);
            else if (key == "max_attempts") config_.registration.max_attempts = to_uint("registration." + key, value);
            else if (key == "backoff_sec") config_.registration.backoff_sec = to_uint("registration." + key, value);
            else if (key == "settle_sec") config_.registration.settle_sec = to_uint("registration." + key, value);
        }
    }
}

bool Config::load_from_env() {
    Logger::instance().info("Loading config from environment variables");

    try {
        override_from_env();
    } catch (const AgentMeshError& e) {
        Logger::instance().error(std::string("Invalid environment override: ") + e.what());
        return false;
    }
    return true;
}

void Config::override_from_env() {
    // Node config
    if (const char* val = std::getenv("AGENTMESH_AGENT_ID")) {
        config_.node.agent_id = val;
    }
    if (const char* val = std::getenv("AGENTMESH_AGENT_NAME")) {
        config_.node.name = val;
    }
    if (const char* val = std::getenv("AGENTMESH_CAPABILITIES")) {
        config_.node.capabilities = split_list(val);
    }
    if (const char* val = std::getenv("AGENTMESH_HOST")) {
        config_.node.host = val;
    }
    if (const char* val = std::getenv("AGENTMESH_PORT")) {
        config_.node.port = to_port("AGENTMESH_PORT", val);
    }
    if (const char* val = std::getenv("AGENTMESH_BIND_ADDRESS")) {
        config_.node.bind_address = val;
    }
    if (const char* val = std::getenv("AGENTMESH_PROVIDER")) {
        config_.node.provider = val;
    }

    // Log config
    if (const char* val = std::getenv("AGENTMESH_LOG_LEVEL")) {
        config_.log.level = val;
    }

    // Directory and name service
    if (const char* val = std::getenv("AGENTMESH_REGISTRY_URL")) {
        config_.registry.url = val;
    }
    if (const char* val = std::getenv("AGENTMESH_DNS_SERVER")) {
        config_.dns.server = val;
    }
    if (const char* val = std::getenv("AGENTMESH_DNS_PORT")) {
        config_.dns.port = to_port("AGENTMESH_DNS_PORT", val);
    }

    // Gossip
    if (const char* val = std::getenv("AGENTMESH_GOSSIP_INTERVAL")) {
        config_.gossip.interval_sec = to_uint("AGENTMESH_GOSSIP_INTERVAL", val);
    }
    if (const char* val = std::getenv("AGENTMESH_GOSSIP_FANOUT")) {
        config_.gossip.fanout = to_uint("AGENTMESH_GOSSIP_FANOUT", val);
    }
}

bool Config::parse_command_line(int argc, char* argv[]) {
    CLI::App app{"AgentMesh - Decentralized agent discovery and gossip node"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file (INI or .json)");

    // Node options
    std::string capabilities = join(config_.node.capabilities);
    app.add_option("--agent-id", config_.node.agent_id, "Agent identifier (default: {hostname}.agents.local)");
    app.add_option("--name", config_.node.name, "Agent display name");
    app.add_option("--description", config_.node.description, "Agent description");
    app.add_option("--capabilities", capabilities, "Comma separated capability list");
    app.add_option("--host", config_.node.host, "Advertised host name");
    app.add_option("--port", config_.node.port, "HTTP listen port");
    app.add_option("--bind-address", config_.node.bind_address, "Bind address");
    app.add_option("--provider", config_.node.provider, "Model provider");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Directory and name service
    app.add_option("--registry-url", config_.registry.url, "Directory service base URL");
    app.add_option("--dns-server", config_.dns.server, "Name server address");
    app.add_option("--dns-port", config_.dns.port, "Name server port");

    // Discovery and peers
    app.add_option("--cache-ttl", config_.discovery.cache_ttl_sec, "Discovery cache TTL (seconds)");
    app.add_option("--refresh-interval", config_.discovery.refresh_interval_sec, "Full refresh interval (seconds)");
    app.add_option("--peer-ttl", config_.peers.peer_ttl_sec, "Peer idle TTL (seconds)");

    // Gossip
    app.add_option("--gossip-interval", config_.gossip.interval_sec, "Gossip round interval (seconds)");
    app.add_option("--gossip-fanout", config_.gossip.fanout, "Peers contacted per gossip round");
    app.add_option("--gossip-max-peers", config_.gossip.max_peers_per_message, "Peer ids sent per exchange");
    bool no_gossip = false;
    app.add_flag("--no-gossip", no_gossip, "Disable the gossip loop");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            app.exit(e);
            exit_requested_ = true;
            return false;
        }
        std::cerr << "Command line parse error: " << e.what() << std::endl;
        return false;
    }

    config_.node.capabilities = split_list(capabilities);
    if (no_gossip) {
        config_.gossip.enable = false;
    }

    if (!config_file.empty()) {
        if (!load_from_file(config_file)) {
            return false;
        }
    }

    apply_defaults();
    Logger::instance().configure(config_.log);
    return true;
}

void Config::apply_defaults() {
    std::string hostname = local_hostname();
    if (config_.node.agent_id.empty()) {
        config_.node.agent_id = hostname + ".agents.local";
    }
    if (config_.node.host.empty()) {
        config_.node.host = hostname;
    }
}

bool Config::validate() const {
    if (config_.node.agent_id.empty()) {
        Logger::instance().error("node.agent_id is required");
        return false;
    }
    if (config_.gossip.fanout == 0) {
        Logger::instance().error("gossip.fanout must be greater than zero");
        return false;
    }
    if (config_.gossip.max_concurrent_exchanges == 0) {
        Logger::instance().error("gossip.max_concurrent_exchanges must be greater than zero");
        return false;
    }
    if (!parse_url(config_.registry.url)) {
        Logger::instance().error("registry.url is not a valid http URL: " + config_.registry.url);
        return false;
    }
    return true;
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Agent ID: " + config_.node.agent_id);
    Logger::instance().info("Advertised: " + config_.node.host + ":" + std::to_string(config_.node.port));
    Logger::instance().info("Capabilities: " + join(config_.node.capabilities));
    Logger::instance().info("Log Level: " + config_.log.level);
    Logger::instance().info("Registry: " + config_.registry.url);
    Logger::instance().info("DNS Server: " + (config_.dns.server.empty() ? std::string("system") : config_.dns.server) +
                            ":" + std::to_string(config_.dns.port));
    Logger::instance().info("Discovery methods: " + join(config_.discovery.methods));
    Logger::instance().info("Gossip: interval=" + std::to_string(config_.gossip.interval_sec) +
                            "s fanout=" + std::to_string(config_.gossip.fanout));
}

} // namespace agentmesh
