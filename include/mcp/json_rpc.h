#pragma once

/**
 * @file json_rpc.h
 * @brief JSON-RPC 2.0 message helpers for line-delimited tool servers
 */

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace live_relay {
namespace mcp {
namespace json_rpc {

/// params is omitted when null
nlohmann::json make_request(int64_t id, const std::string& method,
                            const nlohmann::json& params = nlohmann::json());

nlohmann::json make_notification(const std::string& method,
                                 const nlohmann::json& params = nlohmann::json());

enum class MessageKind {
    Result,         ///< response carrying "result"
    Error,          ///< response carrying "error"
    Notification,   ///< server-initiated, no id
    Request,        ///< server-initiated with id and method
    Invalid
};

MessageKind classify(const nlohmann::json& message);

/// Integer id of a response, if it has one
std::optional<int64_t> message_id(const nlohmann::json& message);

/// error.message of an error response, "Unknown error" when absent
std::string error_message(const nlohmann::json& message);

} // namespace json_rpc
} // namespace mcp
} // namespace live_relay
