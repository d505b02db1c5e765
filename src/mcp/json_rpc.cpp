#include "mcp/json_rpc.h"

using json = nlohmann::json;

namespace live_relay {
namespace mcp {
namespace json_rpc {

json make_request(int64_t id, const std::string& method, const json& params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json make_notification(const std::string& method, const json& params) {
    json notification = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

MessageKind classify(const json& message) {
    if (!message.is_object()) {
        return MessageKind::Invalid;
    }
    bool has_id = message.contains("id") && !message["id"].is_null();
    if (message.contains("method")) {
        return has_id ? MessageKind::Request : MessageKind::Notification;
    }
    if (!has_id) {
        return MessageKind::Invalid;
    }
    if (message.contains("result")) {
        return MessageKind::Result;
    }
    if (message.contains("error")) {
        return MessageKind::Error;
    }
    return MessageKind::Invalid;
}

std::optional<int64_t> message_id(const json& message) {
    if (!message.is_object() || !message.contains("id")) {
        return std::nullopt;
    }
    const auto& id = message["id"];
    if (id.is_number_integer()) {
        return id.get<int64_t>();
    }
    return std::nullopt;
}

std::string error_message(const json& message) {
    if (message.is_object() && message.contains("error")) {
        const auto& error = message["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
    }
    return "Unknown error";
}

} // namespace json_rpc
} // namespace mcp
} // namespace live_relay
