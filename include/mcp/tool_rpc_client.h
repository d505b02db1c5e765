#pragma once

/**
 * @file tool_rpc_client.h
 * @brief One tool server process spoken to over line-delimited JSON-RPC
 */

#include "config.h"
#include "errors.h"
#include "mcp/child_process.h"
#include "mcp/tool.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace live_relay {
namespace mcp {

struct ToolClientOptions {
    std::chrono::milliseconds request_timeout{constants::mcp::REQUEST_TIMEOUT_MS};
    std::chrono::milliseconds shutdown_grace{constants::mcp::SHUTDOWN_GRACE_MS};
    std::string client_name = APP_NAME;
    std::string client_version = APP_VERSION;

    static ToolClientOptions from_config(const ToolsConfig& tools);
};

/// Outgoing request awaiting its response line
struct PendingRequest {
    int64_t id = 0;
    std::chrono::steady_clock::time_point issued_at;
};

/**
 * @brief JSON-RPC client owning one tool server subprocess
 *
 * One request is in flight at a time; concurrent callers queue on an
 * internal mutex. Status queries do not wait for an in-flight request.
 */
class ToolRPCClient {
public:
    ToolRPCClient(ToolServerConfig server, ToolClientOptions options = ToolClientOptions());
    ~ToolRPCClient();

    ToolRPCClient(const ToolRPCClient&) = delete;
    ToolRPCClient& operator=(const ToolRPCClient&) = delete;

    /**
     * @brief Start the process, run the initialize handshake and list tools
     * @return false on any failure; the process is torn down and the
     *         client stays disconnected
     */
    bool connect();

    /// tools/list. Empty on failure (logged).
    std::vector<ToolDescriptor> list_tools();

    /// tools/call with {name, arguments}
    ToolCallResult execute_tool(const std::string& tool, const nlohmann::json& arguments);

    /**
     * @brief Terminate the process (SIGTERM, grace, SIGKILL). Idempotent.
     *
     * Bounded by about twice the shutdown grace even when a call is in
     * flight: a child still holding the client after SIGTERM is killed.
     */
    void disconnect();

    bool is_connected() const { return connected_.load(); }

    /// Connected and the child has not exited. A dead child is dropped here.
    bool is_alive();

    const std::string& name() const { return server_.name; }

    std::vector<ToolDescriptor> tools() const;

    /// Tool list exactly as the server returned it
    nlohmann::json raw_tools() const;

    /// {server, connected, tool_count, tools:[names]}
    nlohmann::json get_status();

    /// Id of the most recently issued request (0 before the first)
    int64_t last_request_id() const { return next_id_.load(); }

private:
    Result<nlohmann::json> send_request(const std::string& method, const nlohmann::json& params);
    void send_notification(const std::string& method);
    std::vector<ToolDescriptor> list_tools_locked();
    // Child exited or its pipes broke: reap it and forget its tools
    void drop_exited_locked(const std::string& reason);

    ToolServerConfig server_;
    ToolClientOptions options_;

    std::timed_mutex io_mutex_;   // guards process_ and pending_
    ChildProcess process_;
    std::map<int64_t, PendingRequest> pending_;
    std::atomic<pid_t> live_pid_{-1};

    std::atomic<bool> connected_{false};
    std::atomic<int64_t> next_id_{0};

    mutable std::mutex tools_mutex_;
    nlohmann::json raw_tools_ = nlohmann::json::array();
    std::vector<ToolDescriptor> tools_;
};

} // namespace mcp
} // namespace live_relay
