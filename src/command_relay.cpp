#include "command_relay.h"
#include "core/constants.h"
#include "line_reader.h"
#include "logger.h"
#include "session_transcoder.h"
#include "utils.h"
#include <stdexcept>

using json = nlohmann::json;

namespace live_relay {

CommandRelay::CommandRelay(StreamPipeline& pipeline,
                           ChannelTextIntake& intake,
                           ControllerSink& sink,
                           mcp::ToolHostRegistry& registry,
                           mcp::ToolCallExecutor& executor,
                           EventEmitter& events)
    : pipeline_(pipeline),
      intake_(intake),
      sink_(sink),
      registry_(registry),
      executor_(executor),
      events_(events) {}

void CommandRelay::run(int input_fd) {
    events_.emit("ready", {{"message", "Gemini Live service ready"}});
    LOG_RELAY("Ready for controller commands");

    LineReader reader(input_fd);
    std::string line;
    while (reader.read_line([this] { return stop_requested_.load(); }, line)) {
        if (utils::is_empty_or_whitespace(line)) {
            continue;
        }
        handle_line(line);
    }

    LOG_RELAY(reader.eof() ? "Controller closed input" : "Stop requested");
    shutdown();
}

void CommandRelay::handle_line(const std::string& line) {
    auto decoded = decode_command(line);
    if (!decoded) {
        Logger::warn("[Relay] Rejected command (" + decoded.error().describe() + ")");
        events_.emit_error(decoded.error().message);
        return;
    }

    const Command& command = decoded.value();
    Logger::debug(std::string("[Relay] Command: ") + command_name(command));
    try {
        std::visit([this](const auto& cmd) { this->handle(cmd); }, command);
    } catch (const std::exception& e) {
        Logger::error(std::string("[Relay] ") + command_name(command) + " failed: " + e.what());
        events_.emit_error(std::string("Error handling command: ") + e.what());
    }
}

void CommandRelay::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    pipeline_.stop();
    executor_.shutdown();
    // Kills the servers first so calls still in flight fail fast
    registry_.shutdown();
    executor_.wait_for_completion();
}

void CommandRelay::handle(const StartCommand& cmd) {
    if (pipeline_.state() != PipelineState::Idle) {
        events_.emit_error("Session already running");
        return;
    }
    auto started = pipeline_.start(cmd.mode);
    if (!started) {
        events_.emit_error("Failed to start session: " + started.error().message);
        return;
    }
    events_.emit_status(true, std::string("Started Gemini Live session (") + video_mode_name(cmd.mode) + ")");
}

void CommandRelay::handle(const StopCommand&) {
    if (pipeline_.state() == PipelineState::Idle) {
        events_.emit_status(false, "Stopped Gemini Live session");
        return;
    }
    // The sink reports the final status once teardown completes
    pipeline_.stop();
}

void CommandRelay::handle(const MessageCommand& cmd) {
    if (!pipeline_.is_running()) {
        events_.emit_error("Session not running");
        return;
    }

    ClientTurn turn;
    if (cmd.image) {
        auto frame = SessionTranscoder::frame_from_base64(cmd.image->mime_type, cmd.image->data);
        if (!frame) {
            events_.emit_error("Invalid image: " + frame.error().message);
            return;
        }
        turn.image = std::move(frame.value());
    }
    if (cmd.text && !cmd.text->empty()) {
        turn.text = sink_.is_transcribing()
                        ? std::string(constants::controller::TRANSCRIPTION_PROMPT) + *cmd.text
                        : *cmd.text;
    }
    if (!turn.text && !turn.image) {
        return;
    }

    if (!intake_.submit(std::move(turn))) {
        events_.emit_error("Session not running");
    }
}

void CommandRelay::handle(const InterruptCommand&) {
    size_t discarded = pipeline_.interrupt();
    LOG_RELAY("Interrupt: " + std::to_string(discarded) + " pending audio buffers dropped");
}

void CommandRelay::handle(const StartTranscriptionCommand&) {
    sink_.begin_transcription();
    if (pipeline_.is_running()) {
        events_.emit("transcription_started", {{"message", "Transcription mode enabled, listening for audio"}});
    } else {
        events_.emit_error("Cannot start transcription: session not ready");
    }
}

void CommandRelay::handle(const StopTranscriptionCommand&) {
    std::string text = sink_.end_transcription();
    if (!text.empty()) {
        events_.emit("transcription_final", {{"text", text}});
    }
    events_.emit("transcription_stopped", {{"message", "Transcription mode disabled"}});
}

void CommandRelay::handle(const AddServerCommand& cmd) {
    events_.emit("mcp_server_added", registry_.add_server(cmd.server));
}

void CommandRelay::handle(const RemoveServerCommand& cmd) {
    events_.emit("mcp_server_removed", registry_.remove_server(cmd.server_name));
}

void CommandRelay::handle(const GetToolsCommand&) {
    events_.emit("mcp_tools_response", {{"tools", registry_.get_all_tools()}});
}

void CommandRelay::handle(const GetServerToolsCommand& cmd) {
    auto tools = registry_.get_server_tools(cmd.server_name);
    if (!tools) {
        events_.emit_error("Server " + cmd.server_name + " not found");
        return;
    }
    events_.emit("mcp_server_tools_response", {{"server", cmd.server_name}, {"tools", *tools}});
}

void CommandRelay::handle(const ExecuteToolCommand& cmd) {
    mcp::ToolCallRequest request;
    request.server = cmd.server;
    request.tool = cmd.tool;
    request.params = cmd.params;

    EventEmitter& events = events_;
    bool queued = executor_.execute_async(request, [&events](const mcp::ToolCallResult& result) {
        events.emit("mcp_tool_result", result.to_json());
    });
    if (!queued) {
        auto result = mcp::ToolCallResult::error_result(cmd.server, cmd.tool, "Tool executor is shut down");
        events_.emit("mcp_tool_result", result.to_json());
    }
}

void CommandRelay::handle(const GetStatusCommand& cmd) {
    events_.emit("mcp_status_response", registry_.get_status(cmd.server_name));
}

} // namespace live_relay
