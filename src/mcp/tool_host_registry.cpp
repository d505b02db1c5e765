#include "mcp/tool_host_registry.h"
#include "logger.h"

using json = nlohmann::json;

namespace live_relay {
namespace mcp {

ToolHostRegistry::ToolHostRegistry(ToolClientOptions options)
    : options_(std::move(options)) {}

ToolHostRegistry::~ToolHostRegistry() {
    shutdown();
}

json ToolHostRegistry::add_server(const ToolServerConfig& server) {
    auto failure = [&server](const std::string& error) {
        return json{{"success", false}, {"server", server.name}, {"error", error}};
    };

    if (server.name.empty()) {
        return failure("Missing server name");
    }

    std::shared_ptr<ToolRPCClient> existing = find(server.name);
    if (existing && existing->is_alive()) {
        return failure("Server " + server.name + " already connected");
    }

    // Connect outside the lock; the handshake can take up to the request timeout
    auto client = std::make_shared<ToolRPCClient>(server, options_);
    if (!client->connect()) {
        return failure("Failed to connect to " + server.name);
    }

    std::shared_ptr<ToolRPCClient> replaced;
    bool lost_race = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(server.name);
        if (it != servers_.end() && it->second != existing) {
            // A concurrent add of the same name finished first
            lost_race = true;
        } else {
            if (it != servers_.end()) {
                replaced = it->second;
            }
            servers_[server.name] = client;
        }
    }
    if (lost_race) {
        client->disconnect();
        return failure("Server " + server.name + " already connected");
    }
    if (replaced) {
        replaced->disconnect();
    }

    LOG_MCP("Added server " + server.name);
    return {{"success", true}, {"server", server.name}, {"tools", client->raw_tools()}};
}

json ToolHostRegistry::remove_server(const std::string& name) {
    std::shared_ptr<ToolRPCClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = servers_.find(name);
        if (it == servers_.end()) {
            return {{"success", false}, {"server", name}, {"error", "Server " + name + " not found"}};
        }
        client = it->second;
        servers_.erase(it);
    }
    client->disconnect();
    LOG_MCP("Removed server " + name);
    return {{"success", true}, {"server", name}};
}

json ToolHostRegistry::get_all_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json catalog = json::object();
    for (const auto& entry : servers_) {
        // A server whose process died publishes nothing
        if (!entry.second->is_alive()) {
            continue;
        }
        for (const auto& tool : entry.second->tools()) {
            catalog[tool.key()] = tool.to_json();
        }
    }
    return catalog;
}

std::optional<json> ToolHostRegistry::get_server_tools(const std::string& name) const {
    auto client = find(name);
    if (!client) {
        return std::nullopt;
    }
    return client->raw_tools();
}

ToolCallResult ToolHostRegistry::execute_tool(const std::string& server, const std::string& tool,
                                              const json& params) {
    auto client = find(server);
    if (!client) {
        return ToolCallResult::error_result(server, tool, "Server " + server + " not found");
    }
    if (!client->is_alive()) {
        return ToolCallResult::error_result(server, tool, "Server " + server + " is not connected");
    }
    return client->execute_tool(tool, params);
}

json ToolHostRegistry::get_status(const std::optional<std::string>& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (name) {
        auto it = servers_.find(*name);
        if (it == servers_.end()) {
            return {{"error", "Server " + *name + " not found"}};
        }
        return it->second->get_status();
    }

    json all = json::object();
    for (const auto& entry : servers_) {
        all[entry.first] = entry.second->get_status();
    }
    return all;
}

std::vector<std::string> ToolHostRegistry::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : servers_) {
        names.push_back(entry.first);
    }
    return names;
}

bool ToolHostRegistry::has_server(const std::string& name) const {
    return find(name) != nullptr;
}

void ToolHostRegistry::shutdown() {
    std::map<std::string, std::shared_ptr<ToolRPCClient>> servers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        servers.swap(servers_);
    }
    for (auto& entry : servers) {
        entry.second->disconnect();
    }
    if (!servers.empty()) {
        LOG_MCP("Shut down " + std::to_string(servers.size()) + " server(s)");
    }
}

std::shared_ptr<ToolRPCClient> ToolHostRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(name);
    return it == servers_.end() ? nullptr : it->second;
}

} // namespace mcp
} // namespace live_relay
