#include "controller_protocol.h"
#include "core/constants.h"

using json = nlohmann::json;

namespace live_relay {

namespace {

// Field readers fill `out` and return an empty string, or return the error text.

std::string require_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key) || !j[key].is_string()) {
        return std::string("Missing or invalid field '") + key + "'";
    }
    out = j[key].get<std::string>();
    if (out.empty()) {
        return std::string("Field '") + key + "' must not be empty";
    }
    return "";
}

std::string optional_string(const json& j, const char* key, std::optional<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return "";
    }
    if (!j[key].is_string()) {
        return std::string("Field '") + key + "' must be a string";
    }
    out = j[key].get<std::string>();
    return "";
}

Result<Command> decode_start(const json& j) {
    StartCommand cmd;
    std::string mode = constants::controller::DEFAULT_START_MODE;
    if (j.contains("options") && !j["options"].is_null()) {
        const auto& options = j["options"];
        if (!options.is_object()) {
            return make_parse_error("Field 'options' must be an object");
        }
        if (options.contains("mode") && !options["mode"].is_null()) {
            if (!options["mode"].is_string()) {
                return make_parse_error("Field 'options.mode' must be a string");
            }
            mode = options["mode"].get<std::string>();
        }
    }
    auto parsed = parse_video_mode(mode);
    if (!parsed) {
        return make_parse_error("Invalid mode '" + mode + "' (expected camera, screen or none)");
    }
    cmd.mode = *parsed;
    return Command(cmd);
}

Result<Command> decode_message(const json& j) {
    MessageCommand cmd;
    std::string err = optional_string(j, "text", cmd.text);
    if (!err.empty()) {
        return make_parse_error(err);
    }
    if (j.contains("image") && !j["image"].is_null()) {
        const auto& image = j["image"];
        if (!image.is_object()) {
            return make_parse_error("Field 'image' must be an object");
        }
        ImagePayload payload;
        err = require_string(image, "mime_type", payload.mime_type);
        if (err.empty()) {
            err = require_string(image, "data", payload.data);
        }
        if (!err.empty()) {
            return make_parse_error("image: " + err);
        }
        cmd.image = std::move(payload);
    }
    return Command(std::move(cmd));
}

Result<Command> decode_add_server(const json& j) {
    AddServerCommand cmd;
    std::string err = require_string(j, "server_name", cmd.server.name);
    if (err.empty()) {
        err = require_string(j, "server_command", cmd.server.command);
    }
    if (!err.empty()) {
        return make_parse_error(err);
    }

    if (j.contains("server_args") && !j["server_args"].is_null()) {
        if (!j["server_args"].is_array()) {
            return make_parse_error("Field 'server_args' must be an array");
        }
        for (const auto& arg : j["server_args"]) {
            if (!arg.is_string()) {
                return make_parse_error("Field 'server_args' must contain strings");
            }
            cmd.server.args.push_back(arg.get<std::string>());
        }
    }

    if (j.contains("server_env") && !j["server_env"].is_null()) {
        if (!j["server_env"].is_object()) {
            return make_parse_error("Field 'server_env' must be an object");
        }
        for (auto it = j["server_env"].begin(); it != j["server_env"].end(); ++it) {
            // Non-string values are passed in their JSON spelling
            cmd.server.env[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
    }
    return Command(std::move(cmd));
}

Result<Command> decode_execute_tool(const json& j) {
    ExecuteToolCommand cmd;
    std::string err = require_string(j, "server", cmd.server);
    if (err.empty()) {
        err = require_string(j, "tool", cmd.tool);
    }
    if (!err.empty()) {
        return make_parse_error(err);
    }
    if (j.contains("params") && !j["params"].is_null()) {
        if (!j["params"].is_object()) {
            return make_parse_error("Field 'params' must be an object");
        }
        cmd.params = j["params"];
    }
    return Command(std::move(cmd));
}

template<typename T>
Result<Command> decode_server_name(const json& j) {
    T cmd;
    std::string err = require_string(j, "server_name", cmd.server_name);
    if (!err.empty()) {
        return make_parse_error(err);
    }
    return Command(std::move(cmd));
}

} // namespace

Result<Command> decode_command(const std::string& line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        return make_parse_error("Invalid JSON command");
    }
    if (!j.is_object()) {
        return make_parse_error("Command must be a JSON object");
    }
    if (!j.contains("command") || !j["command"].is_string()) {
        return make_parse_error("Missing 'command' field");
    }

    const std::string name = j["command"].get<std::string>();
    if (name == "start") return decode_start(j);
    if (name == "stop") return Command(StopCommand{});
    if (name == "message") return decode_message(j);
    if (name == "interrupt") return Command(InterruptCommand{});
    if (name == "start_transcription") return Command(StartTranscriptionCommand{});
    if (name == "stop_transcription") return Command(StopTranscriptionCommand{});
    if (name == "mcp_add_server") return decode_add_server(j);
    if (name == "mcp_remove_server") return decode_server_name<RemoveServerCommand>(j);
    if (name == "mcp_get_tools") return Command(GetToolsCommand{});
    if (name == "mcp_get_server_tools") return decode_server_name<GetServerToolsCommand>(j);
    if (name == "mcp_execute_tool") return decode_execute_tool(j);
    if (name == "mcp_get_status") {
        GetStatusCommand cmd;
        std::string err = optional_string(j, "server_name", cmd.server_name);
        if (!err.empty()) {
            return make_parse_error(err);
        }
        return Command(std::move(cmd));
    }

    return make_parse_error("Unknown command: " + name);
}

const char* command_name(const Command& command) {
    static const char* const names[] = {
        "start",
        "stop",
        "message",
        "interrupt",
        "start_transcription",
        "stop_transcription",
        "mcp_add_server",
        "mcp_remove_server",
        "mcp_get_tools",
        "mcp_get_server_tools",
        "mcp_execute_tool",
        "mcp_get_status"
    };
    static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<Command>,
                  "command name table out of sync");
    return names[command.index()];
}

} // namespace live_relay
