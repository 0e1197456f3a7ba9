#include "agentmesh/discovery/agent_record.h"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace agentmesh {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> string_list(const json& doc, const char* key) {
    std::vector<std::string> out;
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::map<std::string, std::string> string_map(const json& doc, const char* key) {
    std::map<std::string, std::string> out;
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_object()) return out;
    for (auto kv = it->begin(); kv != it->end(); ++kv) {
        if (kv.value().is_string()) out[kv.key()] = kv.value().get<std::string>();
    }
    return out;
}

std::string scalar_text(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    return it->dump();
}

} // anonymous namespace

std::string to_string(Provenance source) {
    switch (source) {
        case Provenance::Registry: return "registry";
        case Provenance::Dns: return "dns";
        case Provenance::Gossip: return "gossip";
        default: return "unknown";
    }
}

bool AgentRecord::has_capability(const std::string& capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

AgentRecord make_placeholder(const std::string& id, const std::string& discovered_via) {
    AgentRecord record;
    record.id = id;
    record.source = Provenance::Gossip;
    record.needs_resolution = true;
    record.discovered_via = discovered_via;
    return record;
}

json agent_to_json(const AgentRecord& record) {
    json doc = {
        {"id", record.id},
        {"name", record.name},
        {"description", record.description},
        {"capabilities", record.capabilities},
        {"interfaces", record.interfaces},
        {"endpoints", record.endpoints},
        {"version", record.version},
        {"protocols", record.protocols},
        {"model_info", {{"provider", record.provider}}},
        {"owner", record.owner},
        {"last_update", record.last_update}
    };

    if (!record.host.empty()) {
        doc["host"] = record.host;
    }
    if (!record.port.empty()) {
        bool numeric = std::all_of(record.port.begin(), record.port.end(),
                                   [](unsigned char c) { return std::isdigit(c); });
        if (numeric && record.port.size() < 10) {
            doc["port"] = std::stoi(record.port);
        } else {
            doc["port"] = record.port;
        }
    }
    if (record.source != Provenance::Unknown) {
        doc["source"] = to_string(record.source);
    }
    if (record.needs_resolution) {
        doc["needs_resolution"] = true;
        doc["discovered_via"] = record.discovered_via;
    }
    return doc;
}

std::optional<AgentRecord> agent_from_json(const json& doc) {
    if (!doc.is_object()) return std::nullopt;

    auto id_it = doc.find("id");
    if (id_it == doc.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        return std::nullopt;
    }

    AgentRecord record;
    record.id = id_it->get<std::string>();
    record.name = scalar_text(doc, "name");
    record.description = scalar_text(doc, "description");
    record.capabilities = string_list(doc, "capabilities");
    record.interfaces = string_map(doc, "interfaces");
    record.endpoints = string_map(doc, "endpoints");
    record.host = scalar_text(doc, "host");
    record.port = scalar_text(doc, "port");
    record.version = scalar_text(doc, "version");
    record.protocols = string_list(doc, "protocols");
    record.owner = scalar_text(doc, "owner");

    auto model = doc.find("model_info");
    if (model != doc.end() && model->is_object()) {
        record.provider = scalar_text(*model, "provider");
    }

    auto last_update = doc.find("last_update");
    if (last_update != doc.end() && last_update->is_number()) {
        record.last_update = last_update->get<double>();
    }
    return record;
}

bool SearchCriteria::matches(const AgentRecord& record) const {
    for (const auto& capability : capabilities) {
        if (!record.has_capability(capability)) return false;
    }

    if (!query.empty()) {
        std::string needle = to_lower(query);
        if (to_lower(record.name).find(needle) == std::string::npos &&
            to_lower(record.description).find(needle) == std::string::npos) {
            return false;
        }
    }

    if (!protocol.empty() &&
        std::find(record.protocols.begin(), record.protocols.end(), protocol) == record.protocols.end()) {
        return false;
    }

    if (!provider.empty() && record.provider != provider) {
        return false;
    }
    return true;
}

} // namespace agentmesh
