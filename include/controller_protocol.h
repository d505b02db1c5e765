#pragma once

/**
 * @file controller_protocol.h
 * @brief Commands a controller sends on stdin, one JSON object per line
 *
 * Each line decodes into exactly one alternative of Command. Required
 * fields are checked here so handlers never see a half-formed command.
 */

#include "config.h"
#include "errors.h"
#include "media_types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace live_relay {

struct StartCommand {
    VideoMode mode = VideoMode::Screen;
};

struct StopCommand {};

struct ImagePayload {
    std::string mime_type;
    std::string data;  ///< base64
};

struct MessageCommand {
    std::optional<std::string> text;
    std::optional<ImagePayload> image;
};

struct InterruptCommand {};
struct StartTranscriptionCommand {};
struct StopTranscriptionCommand {};

struct AddServerCommand {
    ToolServerConfig server;
};

struct RemoveServerCommand {
    std::string server_name;
};

struct GetToolsCommand {};

struct GetServerToolsCommand {
    std::string server_name;
};

struct ExecuteToolCommand {
    std::string server;
    std::string tool;
    nlohmann::json params = nlohmann::json::object();
};

struct GetStatusCommand {
    std::optional<std::string> server_name;
};

using Command = std::variant<
    StartCommand,
    StopCommand,
    MessageCommand,
    InterruptCommand,
    StartTranscriptionCommand,
    StopTranscriptionCommand,
    AddServerCommand,
    RemoveServerCommand,
    GetToolsCommand,
    GetServerToolsCommand,
    ExecuteToolCommand,
    GetStatusCommand>;

/**
 * @brief Decode one command line
 * @return ParseError for invalid JSON, an unknown command or a missing or
 *         mistyped field
 */
Result<Command> decode_command(const std::string& line);

/// Wire name of the command ("start", "mcp_add_server", ...)
const char* command_name(const Command& command);

} // namespace live_relay
