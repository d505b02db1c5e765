#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace live_relay {
namespace mcp {

/**
 * @brief One tool advertised by a tool server's tools/list
 */
struct ToolDescriptor {
    std::string server;
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();

    /// Catalog key, unique across servers
    std::string key() const { return server + "_" + name; }

    /// Entry of the aggregate catalog: {server, name, description, inputSchema}
    nlohmann::json to_json() const {
        return {
            {"server", server},
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }

    /// @return false when the entry has no string "name"
    static bool from_json(const std::string& server, const nlohmann::json& entry, ToolDescriptor& out) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            return false;
        }
        out.server = server;
        out.name = entry["name"].get<std::string>();
        out.description = entry.contains("description") && entry["description"].is_string()
                              ? entry["description"].get<std::string>()
                              : "";
        out.input_schema = entry.contains("inputSchema") ? entry["inputSchema"] : nlohmann::json::object();
        return true;
    }
};

/**
 * @brief Uniform outcome of a tool call
 *
 * Protocol errors, application errors and transport failures all end up
 * here with success=false and a message.
 */
struct ToolCallResult {
    bool success = false;
    nlohmann::json data;   // "result" of a successful call
    std::string error;
    std::string server;
    std::string tool;

    static ToolCallResult success_result(const std::string& server, const std::string& tool,
                                         nlohmann::json data) {
        ToolCallResult result;
        result.success = true;
        result.data = std::move(data);
        result.server = server;
        result.tool = tool;
        return result;
    }

    static ToolCallResult error_result(const std::string& server, const std::string& tool,
                                       const std::string& error_msg) {
        ToolCallResult result;
        result.success = false;
        result.error = error_msg;
        result.server = server;
        result.tool = tool;
        return result;
    }

    nlohmann::json to_json() const {
        nlohmann::json j = {{"success", success}};
        if (success) {
            j["data"] = data;
        } else {
            j["error"] = error;
        }
        j["server"] = server;
        j["tool"] = tool;
        return j;
    }
};

} // namespace mcp
} // namespace live_relay
