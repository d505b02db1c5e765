#pragma once

/**
 * @file command_relay.h
 * @brief Controller mode: commands in on stdin, events out on stdout
 */

#include "controller_protocol.h"
#include "controller_sink.h"
#include "event_emitter.h"
#include "mcp/tool_call_executor.h"
#include "mcp/tool_host_registry.h"
#include "stream_pipeline.h"
#include "text_intake.h"
#include <atomic>
#include <string>

namespace live_relay {

/**
 * @brief Reads controller commands and dispatches them to the pipeline
 *        and the tool host registry
 *
 * One handler per Command alternative. Decoding and handler failures
 * become "error" events; the loop keeps going.
 */
class CommandRelay {
public:
    CommandRelay(StreamPipeline& pipeline,
                 ChannelTextIntake& intake,
                 ControllerSink& sink,
                 mcp::ToolHostRegistry& registry,
                 mcp::ToolCallExecutor& executor,
                 EventEmitter& events);

    /**
     * @brief Emit "ready", then handle lines from fd until EOF or request_stop()
     *
     * Stops the pipeline and shuts the registry down before returning.
     */
    void run(int input_fd);

    /// Decode and dispatch one command line
    void handle_line(const std::string& line);

    /// Async-signal-safe; run() returns within one poll slice
    void request_stop() { stop_requested_.store(true); }

    /// Stop the pipeline, drain tool calls, disconnect all servers
    void shutdown();

private:
    void handle(const StartCommand& cmd);
    void handle(const StopCommand& cmd);
    void handle(const MessageCommand& cmd);
    void handle(const InterruptCommand& cmd);
    void handle(const StartTranscriptionCommand& cmd);
    void handle(const StopTranscriptionCommand& cmd);
    void handle(const AddServerCommand& cmd);
    void handle(const RemoveServerCommand& cmd);
    void handle(const GetToolsCommand& cmd);
    void handle(const GetServerToolsCommand& cmd);
    void handle(const ExecuteToolCommand& cmd);
    void handle(const GetStatusCommand& cmd);

    StreamPipeline& pipeline_;
    ChannelTextIntake& intake_;
    ControllerSink& sink_;
    mcp::ToolHostRegistry& registry_;
    mcp::ToolCallExecutor& executor_;
    EventEmitter& events_;
    std::atomic<bool> stop_requested_{false};
    bool shut_down_ = false;
};

} // namespace live_relay
