#pragma once

/**
 * @file tool_host_registry.h
 * @brief Connected tool servers and their aggregate tool catalog
 */

#include "config.h"
#include "mcp/tool.h"
#include "mcp/tool_rpc_client.h"
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace live_relay {
namespace mcp {

/**
 * @brief Set of ToolRPCClient instances keyed by server name
 *
 * Tools of every server are published under "{server}_{tool}". All methods
 * are thread-safe; a client removed while one of its calls is in flight
 * stays alive until that call returns.
 */
class ToolHostRegistry {
public:
    explicit ToolHostRegistry(ToolClientOptions options = ToolClientOptions());
    ~ToolHostRegistry();

    ToolHostRegistry(const ToolHostRegistry&) = delete;
    ToolHostRegistry& operator=(const ToolHostRegistry&) = delete;

    /**
     * @brief Start and connect a server, then publish its tools
     * @return {success:true, server, tools:[raw tools/list entries]} or
     *         {success:false, server, error}
     */
    nlohmann::json add_server(const ToolServerConfig& server);

    /// @return {success, server} or {success:false, server, error}
    nlohmann::json remove_server(const std::string& name);

    /// Aggregate catalog of live servers: "{server}_{tool}" -> {server, name, description, inputSchema}
    nlohmann::json get_all_tools() const;

    /// Raw tools/list entries of one server; nullopt if unknown
    std::optional<nlohmann::json> get_server_tools(const std::string& name) const;

    /// Fails fast for unknown or disconnected servers
    ToolCallResult execute_tool(const std::string& server, const std::string& tool,
                                const nlohmann::json& params);

    /**
     * @brief Status of one server, or of every server keyed by name
     *
     * Unknown name yields {"error": "Server X not found"}.
     */
    nlohmann::json get_status(const std::optional<std::string>& name = std::nullopt) const;

    std::vector<std::string> server_names() const;
    bool has_server(const std::string& name) const;

    /// Disconnect and forget every server
    void shutdown();

private:
    std::shared_ptr<ToolRPCClient> find(const std::string& name) const;

    ToolClientOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ToolRPCClient>> servers_;
};

} // namespace mcp
} // namespace live_relay
