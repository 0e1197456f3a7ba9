#include "agentmesh/discovery/registry_client.h"
#include "agentmesh/base/error_code.h"
#include "agentmesh/base/http_client.h"
#include "agentmesh/base/logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace agentmesh {

struct RegistryClient::Impl {
    RegistryConfig config;
    ParsedUrl endpoint;
    std::string base_path;

    Impl(const RegistryConfig& cfg) : config(cfg) {
        auto parsed = parse_url(cfg.url);
        if (!parsed) {
            throw AgentMeshError(ErrorCode::InvalidUrl, "registry url: " + cfg.url);
        }
        endpoint = *parsed;
        // Strip trailing slash so "/agents" can be appended directly
        base_path = endpoint.path == "/" ? "" : endpoint.path;
        while (!base_path.empty() && base_path.back() == '/') {
            base_path.pop_back();
        }
    }

    HttpResponse call(const std::string& method, const std::string& path,
                      uint32_t timeout_sec, const std::string& body = "") {
        return HttpClient::request(method, endpoint.host, endpoint.port,
                                   base_path + path, timeout_sec, body);
    }

    // Throws for anything that is neither success nor 404
    static void check(const HttpResponse& response, const std::string& what) {
        if (response.transport_failed()) {
            throw AgentMeshError(ErrorCode::RegistryError,
                                 what + ": " + response.error_message);
        }
        if (response.status != 404 && !response.ok()) {
            throw AgentMeshError(ErrorCode::RegistryError,
                                 what + ": HTTP " + std::to_string(response.status) +
                                 " " + response.body);
        }
    }
};

std::string build_agents_query(const AgentQuery& query) {
    std::string qs;
    auto append = [&qs](const char* key, const std::string& value) {
        qs += qs.empty() ? "?" : "&";
        qs += key;
        qs += "=";
        qs += url_encode(value);
    };

    if (!query.capability.empty()) append("capability", query.capability);
    if (!query.query.empty()) append("query", query.query);
    if (!query.protocol.empty()) append("protocol", query.protocol);
    if (!query.provider.empty()) append("provider", query.provider);
    if (query.limit) append("limit", std::to_string(*query.limit));
    if (query.offset) append("offset", std::to_string(*query.offset));
    return qs;
}

RegistryClient::RegistryClient(const RegistryConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    Logger::instance().info("Initialized registry client with base URL: " + config.url);
}

RegistryClient::~RegistryClient() = default;

const std::string& RegistryClient::base_url() const {
    return impl_->config.url;
}

bool RegistryClient::register_agent(const AgentRecord& record) {
    Logger::instance().info("Registering agent " + record.id + " with registry");

    try {
        auto response = impl_->call("POST", "/registerAgent",
                                    impl_->config.request_timeout_sec,
                                    agent_to_json(record).dump());
        if (response.ok()) {
            Logger::instance().info("Successfully registered agent with registry");
            return true;
        }

        if (response.transport_failed()) {
            Logger::instance().error("Error registering with registry: " + response.error_message);
        } else {
            Logger::instance().error("Failed to register agent, HTTP code: " + std::to_string(response.status) +
                                     ", response: " + response.body);
        }
        return false;

    } catch (const std::exception& e) {
        Logger::instance().error("Exception during agent registration: " + std::string(e.what()));
        return false;
    }
}

std::optional<AgentRecord> RegistryClient::get_agent(const std::string& id) {
    Logger::instance().debug("Fetching agent " + id + " from registry");

    auto response = impl_->call("GET", "/agents/" + url_encode(id), impl_->config.request_timeout_sec);
    Impl::check(response, "get agent " + id);
    if (response.status == 404) {
        return std::nullopt;
    }

    json doc;
    try {
        doc = json::parse(response.body);
    } catch (const json::exception& e) {
        throw AgentMeshError(ErrorCode::InvalidResponse, "get agent " + id + ": " + e.what());
    }
    return agent_from_json(doc);
}

std::vector<AgentRecord> RegistryClient::list_agents(const AgentQuery& query) {
    auto response = impl_->call("GET", "/agents" + build_agents_query(query),
                                impl_->config.request_timeout_sec);
    Impl::check(response, "list agents");
    if (response.status == 404) {
        throw AgentMeshError(ErrorCode::RegistryError, "list agents: HTTP 404");
    }

    json doc;
    try {
        doc = json::parse(response.body);
    } catch (const json::exception& e) {
        throw AgentMeshError(ErrorCode::InvalidResponse, std::string("list agents: ") + e.what());
    }

    std::vector<AgentRecord> agents;
    auto it = doc.find("agents");
    if (!doc.is_object() || it == doc.end() || !it->is_array()) {
        return agents;
    }
    for (const auto& item : *it) {
        if (auto record = agent_from_json(item)) {
            agents.push_back(std::move(*record));
        } else {
            Logger::instance().warning("Skipping malformed agent entry in registry listing");
        }
    }
    return agents;
}

HeartbeatStatus RegistryClient::heartbeat(const std::string& id) {
    Logger::instance().debug("Sending heartbeat for agent " + id);

    auto response = impl_->call("PUT", "/agents/" + url_encode(id) + "/heartbeat",
                                impl_->config.heartbeat_timeout_sec);
    if (response.transport_failed()) {
        Logger::instance().error("Error sending heartbeat for agent {}: {}", id, response.error_message);
        return HeartbeatStatus::Error;
    }
    if (response.status == 404) {
        Logger::instance().warning("Agent " + id + " not found in registry");
        return HeartbeatStatus::NotFound;
    }
    if (!response.ok()) {
        Logger::instance().error("Heartbeat for agent {} failed, HTTP code: {}", id, response.status);
        return HeartbeatStatus::Error;
    }
    return HeartbeatStatus::Ok;
}

bool RegistryClient::unregister_agent(const std::string& id) {
    Logger::instance().info("Unregistering agent " + id + " from registry");

    auto response = impl_->call("DELETE", "/agents/" + url_encode(id), impl_->config.request_timeout_sec);
    if (!response.ok()) {
        Logger::instance().error("Error unregistering agent {}: {}", id,
                                 response.transport_failed() ? response.error_message
                                                             : "HTTP " + std::to_string(response.status));
        return false;
    }
    return true;
}

} // namespace agentmesh
