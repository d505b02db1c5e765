#include "mcp/tool_rpc_client.h"
#include "logger.h"
#include "mcp/json_rpc.h"
#include <csignal>

using json = nlohmann::json;

namespace live_relay {
namespace mcp {

ToolClientOptions ToolClientOptions::from_config(const ToolsConfig& tools) {
    ToolClientOptions options;
    options.request_timeout = std::chrono::milliseconds(tools.request_timeout_ms);
    options.shutdown_grace = std::chrono::milliseconds(tools.shutdown_grace_ms);
    options.client_name = tools.client_name;
    options.client_version = tools.client_version;
    return options;
}

ToolRPCClient::ToolRPCClient(ToolServerConfig server, ToolClientOptions options)
    : server_(std::move(server)), options_(std::move(options)) {}

ToolRPCClient::~ToolRPCClient() {
    disconnect();
}

bool ToolRPCClient::connect() {
    std::lock_guard<std::timed_mutex> lock(io_mutex_);
    if (connected_.load()) {
        return true;
    }

    ProcessSpec spec;
    spec.command = server_.command;
    spec.args = server_.args;
    spec.env = server_.env;

    auto spawned = process_.spawn(spec);
    if (!spawned) {
        Logger::error("[MCP] " + server_.name + ": failed to start: " + spawned.error().message);
        return false;
    }
    live_pid_.store(process_.pid());

    json params = {
        {"protocolVersion", constants::mcp::PROTOCOL_VERSION},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", options_.client_name}, {"version", options_.client_version}}}
    };
    auto response = send_request("initialize", params);
    if (!response || json_rpc::classify(response.value()) != json_rpc::MessageKind::Result) {
        std::string reason = response ? json_rpc::error_message(response.value()) : response.error().message;
        Logger::error("[MCP] " + server_.name + ": initialize failed: " + reason);
        live_pid_.store(-1);
        process_.terminate(options_.shutdown_grace);
        pending_.clear();
        return false;
    }

    connected_.store(true);
    send_notification("notifications/initialized");

    auto tools = list_tools_locked();
    LOG_MCP(server_.name + " connected (" + std::to_string(tools.size()) + " tools)");
    return true;
}

std::vector<ToolDescriptor> ToolRPCClient::list_tools() {
    std::lock_guard<std::timed_mutex> lock(io_mutex_);
    return list_tools_locked();
}

std::vector<ToolDescriptor> ToolRPCClient::list_tools_locked() {
    auto response = send_request("tools/list", json());
    if (!response) {
        Logger::error("[MCP] " + server_.name + ": tools/list failed: " + response.error().message);
        return {};
    }
    const json& message = response.value();
    if (json_rpc::classify(message) != json_rpc::MessageKind::Result ||
        !message["result"].is_object() || !message["result"].contains("tools") ||
        !message["result"]["tools"].is_array()) {
        Logger::error("[MCP] " + server_.name + ": failed to list tools: " + json_rpc::error_message(message));
        return {};
    }

    const json& listed = message["result"]["tools"];
    std::vector<ToolDescriptor> tools;
    for (const auto& entry : listed) {
        ToolDescriptor descriptor;
        if (ToolDescriptor::from_json(server_.name, entry, descriptor)) {
            tools.push_back(std::move(descriptor));
        } else {
            Logger::warn("[MCP] " + server_.name + ": skipping tool entry without a name");
        }
    }

    std::lock_guard<std::mutex> lock(tools_mutex_);
    raw_tools_ = listed;
    tools_ = tools;
    return tools;
}

ToolCallResult ToolRPCClient::execute_tool(const std::string& tool, const json& arguments) {
    std::lock_guard<std::timed_mutex> lock(io_mutex_);
    if (!process_.is_started()) {
        return ToolCallResult::error_result(server_.name, tool, "Server process not started");
    }

    json params = {
        {"name", tool},
        {"arguments", arguments.is_null() ? json::object() : arguments}
    };
    auto response = send_request("tools/call", params);
    if (!response) {
        Logger::warn("[MCP] " + server_.name + "/" + tool + " (" + response.error().describe() + ")");
        return ToolCallResult::error_result(server_.name, tool, response.error().message);
    }

    const json& message = response.value();
    switch (json_rpc::classify(message)) {
        case json_rpc::MessageKind::Result:
            return ToolCallResult::success_result(server_.name, tool, message["result"]);
        case json_rpc::MessageKind::Error:
            return ToolCallResult::error_result(server_.name, tool, json_rpc::error_message(message));
        default:
            return ToolCallResult::error_result(server_.name, tool, "Invalid response from server");
    }
}

void ToolRPCClient::disconnect() {
    // Wakes a request blocked on this child's stdout so the lock below frees up
    pid_t pid = live_pid_.load();
    if (pid > 0) {
        kill(pid, SIGTERM);
    }

    std::unique_lock<std::timed_mutex> lock(io_mutex_, std::defer_lock);
    if (!lock.try_lock_for(options_.shutdown_grace)) {
        // The in-flight request sees EOF once the child is gone and releases the lock
        pid = live_pid_.load();
        if (pid > 0) {
            Logger::warn("[MCP] " + server_.name + ": still busy after SIGTERM, killing pid " +
                         std::to_string(pid));
            kill(pid, SIGKILL);
        }
        lock.lock();
    }
    bool was_started = process_.is_started();
    live_pid_.store(-1);
    process_.terminate(options_.shutdown_grace);
    pending_.clear();
    connected_.store(false);
    {
        std::lock_guard<std::mutex> tools_lock(tools_mutex_);
        raw_tools_ = json::array();
        tools_.clear();
    }
    if (was_started) {
        LOG_MCP(server_.name + " disconnected");
    }
}

bool ToolRPCClient::is_alive() {
    if (!connected_.load()) {
        return false;
    }
    std::unique_lock<std::timed_mutex> lock(io_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        // A request is in flight; it reports its own failure if the child died
        return true;
    }
    if (!process_.is_alive()) {
        drop_exited_locked("process exited");
        return false;
    }
    return true;
}

std::vector<ToolDescriptor> ToolRPCClient::tools() const {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    return tools_;
}

json ToolRPCClient::raw_tools() const {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    return raw_tools_;
}

json ToolRPCClient::get_status() {
    bool alive = is_alive();
    std::lock_guard<std::mutex> lock(tools_mutex_);
    json names = json::array();
    for (const auto& tool : tools_) {
        names.push_back(tool.name);
    }
    return {
        {"server", server_.name},
        {"connected", alive},
        {"tool_count", tools_.size()},
        {"tools", names}
    };
}

Result<json> ToolRPCClient::send_request(const std::string& method, const json& params) {
    if (!process_.is_started()) {
        return make_state_error("Server process not started");
    }

    PendingRequest request;
    request.id = ++next_id_;
    request.issued_at = std::chrono::steady_clock::now();
    pending_[request.id] = request;

    auto written = process_.write_line(json_rpc::make_request(request.id, method, params).dump());
    if (!written) {
        pending_.erase(request.id);
        if (written.error().type == ErrorType::IOError) {
            drop_exited_locked(written.error().message);
        }
        return written.error();
    }

    auto deadline = request.issued_at + options_.request_timeout;
    while (true) {
        auto line = process_.read_line(deadline);
        if (!line) {
            pending_.erase(request.id);
            if (line.error().type == ErrorType::IOError) {
                drop_exited_locked(line.error().message);
            }
            return line.error();
        }
        if (line.value().empty()) {
            continue;
        }

        json message = json::parse(line.value(), nullptr, false);
        if (message.is_discarded()) {
            pending_.erase(request.id);
            return make_parse_error("Invalid response from server");
        }

        auto kind = json_rpc::classify(message);
        if (kind == json_rpc::MessageKind::Notification || kind == json_rpc::MessageKind::Request) {
            Logger::debug("[MCP] " + server_.name + ": skipping server message '" +
                          message.value("method", std::string()) + "'");
            continue;
        }

        auto id = json_rpc::message_id(message);
        if (!id || *id != request.id) {
            Logger::warn("[MCP] " + server_.name + ": ignoring response for id " +
                         (id ? std::to_string(*id) : std::string("<none>")) +
                         " while waiting for " + std::to_string(request.id));
            continue;
        }

        pending_.erase(request.id);
        return message;
    }
}

void ToolRPCClient::drop_exited_locked(const std::string& reason) {
    bool was_connected = connected_.exchange(false);
    live_pid_.store(-1);
    process_.terminate(std::chrono::milliseconds(0));
    pending_.clear();
    {
        std::lock_guard<std::mutex> tools_lock(tools_mutex_);
        raw_tools_ = json::array();
        tools_.clear();
    }
    if (was_connected) {
        Logger::warn("[MCP] " + server_.name + " lost (" + reason + "), marked disconnected");
    }
}

void ToolRPCClient::send_notification(const std::string& method) {
    if (!process_.is_started()) {
        return;
    }
    auto written = process_.write_line(json_rpc::make_notification(method).dump());
    if (!written) {
        Logger::error("[MCP] " + server_.name + ": failed to send " + method + ": " + written.error().message);
    }
}

} // namespace mcp
} // namespace live_relay
