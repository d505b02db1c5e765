/**
 * Controller boundary: command decoding and the relay's command handling,
 * with an in-memory session and an event stream captured in memory.
 */

#include "command_relay.h"
#include "controller_protocol.h"
#include "controller_sink.h"
#include "event_emitter.h"
#include "test_fakes.h"
#include "test_support.h"
#include "utils.h"
#include <algorithm>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace live_relay;
using namespace live_relay::testing;
using json = nlohmann::json;

namespace {

std::vector<json> parse_events(const std::string& text) {
    std::vector<json> events;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) events.push_back(json::parse(line));
    }
    return events;
}

/// Events emitted after the first `skip`, once at least `skip + count` exist
std::vector<json> next_events(EventEmitter& emitter, std::ostringstream& out, size_t& seen, size_t count) {
    wait_until([&] { return emitter.emitted_count() >= seen + count; });
    auto all = parse_events(out.str());
    std::vector<json> fresh(all.begin() + static_cast<long>(std::min(seen, all.size())), all.end());
    seen = all.size();
    return fresh;
}

} // namespace

int main() {
    // --- decoding ---
    {
        auto start = decode_command(R"({"command":"start","options":{"mode":"camera"}})");
        ASSERT(start.is_ok());
        ASSERT(std::holds_alternative<StartCommand>(start.value()));
        ASSERT(std::get<StartCommand>(start.value()).mode == VideoMode::Camera);

        auto default_start = decode_command(R"({"command":"start"})");
        ASSERT(default_start.is_ok() && std::get<StartCommand>(default_start.value()).mode == VideoMode::Screen);

        auto bad_mode = decode_command(R"({"command":"start","options":{"mode":"hologram"}})");
        ASSERT(bad_mode.is_error() && bad_mode.error().type == ErrorType::ParseError);

        auto message = decode_command(R"({"command":"message","text":"hi","image":{"mime_type":"image/png","data":"AQID"}})");
        ASSERT(message.is_ok());
        const auto& msg = std::get<MessageCommand>(message.value());
        ASSERT(msg.text.value_or("") == "hi");
        ASSERT(msg.image.has_value() && msg.image->mime_type == "image/png" && msg.image->data == "AQID");

        ASSERT(decode_command(R"({"command":"message","image":{"mime_type":"image/png"}})").is_error());
        ASSERT(decode_command(R"({"command":"message","text":5})").is_error());

        auto add = decode_command(R"({"command":"mcp_add_server","server_name":"fs","server_command":"npx",
                                      "server_args":["-y","server-fs"],"server_env":{"ROOT":"/tmp","DEPTH":3}})");
        ASSERT(add.is_ok());
        const auto& server = std::get<AddServerCommand>(add.value()).server;
        ASSERT(server.name == "fs" && server.command == "npx");
        ASSERT(server.args.size() == 2 && server.args[1] == "server-fs");
        ASSERT(server.env.at("ROOT") == "/tmp" && server.env.at("DEPTH") == "3");

        ASSERT(decode_command(R"({"command":"mcp_add_server","server_name":"fs"})").is_error());
        ASSERT(decode_command(R"({"command":"mcp_add_server","server_name":"fs","server_command":"x","server_args":"-y"})").is_error());
        ASSERT(decode_command(R"({"command":"mcp_remove_server"})").is_error());
        ASSERT(decode_command(R"({"command":"mcp_get_server_tools","server_name":""})").is_error());

        auto exec = decode_command(R"({"command":"mcp_execute_tool","server":"calc","tool":"add"})");
        ASSERT(exec.is_ok() && std::get<ExecuteToolCommand>(exec.value()).params.is_object());
        ASSERT(decode_command(R"({"command":"mcp_execute_tool","server":"calc"})").is_error());
        ASSERT(decode_command(R"({"command":"mcp_execute_tool","server":"calc","tool":"add","params":[1]})").is_error());

        auto status_all = decode_command(R"({"command":"mcp_get_status"})");
        ASSERT(status_all.is_ok() && !std::get<GetStatusCommand>(status_all.value()).server_name.has_value());
        auto status_one = decode_command(R"({"command":"mcp_get_status","server_name":"calc"})");
        ASSERT(status_one.is_ok() && std::get<GetStatusCommand>(status_one.value()).server_name.value_or("") == "calc");

        auto unknown = decode_command(R"({"command":"dance"})");
        ASSERT(unknown.is_error() && unknown.error().message == "Unknown command: dance");
        ASSERT(decode_command("not json").is_error());
        ASSERT(decode_command(R"({"text":"no command"})").is_error());
        ASSERT(decode_command(R"(["start"])").is_error());

        ASSERT(std::string(command_name(decode_command(R"({"command":"stop_transcription"})").value())) == "stop_transcription");
        ASSERT(std::string(command_name(exec.value())) == "mcp_execute_tool");
    }

    // --- relay against a fake session ---
    {
        Config config;
        FakeSessionFactory factory;
        FakeDevices devices;
        std::ostringstream out;
        EventEmitter events(out);
        auto sink = std::make_shared<ControllerSink>(events);
        auto intake = std::make_shared<ChannelTextIntake>();
        mcp::ToolHostRegistry registry;
        mcp::ToolCallExecutor executor(registry, 1);
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);
        CommandRelay relay(pipeline, *intake, *sink, registry, executor, events);
        size_t seen = 0;

        relay.handle_line("{not json");
        auto ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "error");
        ASSERT(ev[0]["data"]["message"] == "Invalid JSON command");
        ASSERT(ev[0]["timestamp"].is_number_float());

        relay.handle_line(R"({"command":"dance"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["data"]["message"] == "Unknown command: dance");

        relay.handle_line(R"({"command":"message","text":"hi"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "error" && ev[0]["data"]["message"] == "Session not running");

        relay.handle_line(R"({"command":"start","options":{"mode":"none"}})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "status" && ev[0]["data"]["running"] == true);
        ASSERT(pipeline.is_running());
        auto log = factory.log;

        relay.handle_line(R"({"command":"start"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "error" && ev[0]["data"]["message"] == "Session already running");

        relay.handle_line(R"({"command":"message","text":"hi"})");
        relay.handle_line(R"({"command":"message","image":{"mime_type":"image/png","data":"AQID"}})");
        ASSERT(wait_until([&] { return log->texts().size() == 1 && log->media_count() == 1; }));
        ASSERT(log->texts()[0] == "hi");
        {
            std::lock_guard<std::mutex> l(log->mutex);
            ASSERT(log->media[0].payload == (Bytes{1, 2, 3}));
        }

        relay.handle_line(R"({"command":"message","image":{"mime_type":"image/png","data":"***"}})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "error");

        // Model output
        log->inbound.put(TextDelta{"Hello"});
        log->inbound.put(AudioData{Bytes{1, 2, 3}});
        log->inbound.put(TurnComplete{});
        ev = next_events(events, out, seen, 3);
        ASSERT(ev.size() == 3);
        ASSERT(ev[0]["type"] == "text" && ev[0]["data"]["text"] == "Hello");
        ASSERT(ev[1]["type"] == "audio" && ev[1]["data"]["data"] == utils::base64_encode(Bytes{1, 2, 3}));
        ASSERT(ev[2]["type"] == "turn_complete" && ev[2]["data"]["completed"] == true);

        // Transcription mode
        relay.handle_line(R"({"command":"start_transcription"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "transcription_started");

        relay.handle_line(R"({"command":"message","text":"audio notes"})");
        ASSERT(wait_until([&] { return log->texts().size() == 2; }));
        ASSERT(log->texts()[1] == std::string(constants::controller::TRANSCRIPTION_PROMPT) + "audio notes");

        log->inbound.put(TextDelta{"first"});
        log->inbound.put(TextDelta{"second"});
        ev = next_events(events, out, seen, 2);
        ASSERT(ev.size() == 2 && ev[0]["type"] == "transcription_partial" && ev[1]["data"]["text"] == "second");

        relay.handle_line(R"({"command":"stop_transcription"})");
        ev = next_events(events, out, seen, 2);
        ASSERT(ev.size() == 2);
        ASSERT(ev[0]["type"] == "transcription_final" && ev[0]["data"]["text"] == "first second");
        ASSERT(ev[1]["type"] == "transcription_stopped");

        relay.handle_line(R"({"command":"stop_transcription"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "transcription_stopped");

        // Interrupt emits nothing and keeps the session running
        size_t before = events.emitted_count();
        relay.handle_line(R"({"command":"interrupt"})");
        ASSERT(events.emitted_count() == before);
        ASSERT(pipeline.is_running());

        // Tool host commands without servers
        relay.handle_line(R"({"command":"mcp_get_status"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "mcp_status_response" && ev[0]["data"].empty());

        relay.handle_line(R"({"command":"mcp_get_tools"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "mcp_tools_response" && ev[0]["data"]["tools"].empty());

        relay.handle_line(R"({"command":"mcp_get_server_tools","server_name":"ghost"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "error" && ev[0]["data"]["message"] == "Server ghost not found");

        relay.handle_line(R"({"command":"mcp_execute_tool","server":"ghost","tool":"x","params":{}})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "mcp_tool_result");
        ASSERT(ev[0]["data"]["success"] == false && ev[0]["data"]["error"] == "Server ghost not found");

        relay.handle_line(R"({"command":"mcp_remove_server","server_name":"ghost"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "mcp_server_removed" && ev[0]["data"]["success"] == false);

        relay.handle_line(R"({"command":"mcp_add_server","server_name":"ghost"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "error");

        // Stop reports once, from the pipeline teardown
        relay.handle_line(R"({"command":"stop"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "status" && ev[0]["data"]["running"] == false);
        ASSERT(pipeline.state() == PipelineState::Idle);

        relay.handle_line(R"({"command":"stop"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "status" && ev[0]["data"]["running"] == false);

        relay.handle_line(R"({"command":"start_transcription"})");
        ev = next_events(events, out, seen, 1);
        ASSERT(ev.size() == 1 && ev[0]["type"] == "error");
        ASSERT(sink->is_transcribing());

        relay.shutdown();
    }

    // --- run(): ready first, commands until EOF, then shutdown ---
    {
        Config config;
        FakeSessionFactory factory;
        FakeDevices devices;
        std::ostringstream out;
        EventEmitter events(out);
        auto sink = std::make_shared<ControllerSink>(events);
        auto intake = std::make_shared<ChannelTextIntake>();
        mcp::ToolHostRegistry registry;
        mcp::ToolCallExecutor executor(registry, 1);
        StreamPipeline pipeline(config, factory, devices.make(), sink, intake);
        CommandRelay relay(pipeline, *intake, *sink, registry, executor, events);

        int fds[2];
        ASSERT(pipe(fds) == 0);
        std::string script =
            "{\"command\":\"start\",\"options\":{\"mode\":\"none\"}}\n"
            "\n"
            "{\"command\":\"mcp_get_tools\"}\n";
        ASSERT(write(fds[1], script.data(), script.size()) == static_cast<ssize_t>(script.size()));
        close(fds[1]);

        relay.run(fds[0]);
        close(fds[0]);

        auto all = parse_events(out.str());
        ASSERT(all.size() == 4);
        ASSERT(all[0]["type"] == "ready");
        ASSERT(all[1]["type"] == "status" && all[1]["data"]["running"] == true);
        ASSERT(all[2]["type"] == "mcp_tools_response");
        ASSERT(all[3]["type"] == "status" && all[3]["data"]["running"] == false);
        ASSERT(pipeline.state() == PipelineState::Idle);
    }

    return finish("test_controller");
}
