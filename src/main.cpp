#include "audio_io.h"
#include "command_relay.h"
#include "config.h"
#include "controller_sink.h"
#include "event_emitter.h"
#include "gemini_live_session.h"
#include "logger.h"
#include "mcp/tool_call_executor.h"
#include "mcp/tool_host_registry.h"
#include "path_utils.h"
#include "response_sink.h"
#include "stream_pipeline.h"
#include "text_intake.h"
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

namespace live_relay {

static StreamPipeline* g_pipeline = nullptr;
static CommandRelay* g_relay = nullptr;

// Only flag stores here; the pipeline supervisor and relay loop poll them
void signal_handler(int) {
    if (g_pipeline) {
        g_pipeline->request_stop();
    }
    if (g_relay) {
        g_relay->request_stop();
    }
}

struct Options {
    std::string mode = constants::controller::DEFAULT_START_MODE;
    std::string config_path;
    std::string log_level;
    bool list_devices = false;
    bool help = false;
};

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  --mode camera|screen|none|controller  what to stream (default: screen)\n"
              << "  --config PATH       config file or directory holding config.json\n"
              << "  --log-level LEVEL   debug, info, warn or error\n"
              << "  --list-devices      print audio devices and exit\n"
              << "  --help              show this message\n";
}

static bool parse_args(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto take_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--mode") {
            if (!take_value(options.mode)) return false;
        } else if (arg == "--config") {
            if (!take_value(options.config_path)) return false;
        } else if (arg == "--log-level") {
            if (!take_value(options.log_level)) return false;
        } else if (arg == "--list-devices") {
            options.list_devices = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

static int run_standalone(const Config& config, VideoMode mode) {
    GeminiSessionFactory factory;
    auto sink = std::make_shared<ConsoleSink>(std::cout);
    auto intake = std::make_shared<ConsoleTextIntake>(STDIN_FILENO, std::cout);

    StreamPipeline pipeline(config, factory, PipelineDevices::from_config(config), sink, intake);
    g_pipeline = &pipeline;

    auto started = pipeline.start(mode);
    if (!started) {
        g_pipeline = nullptr;
        Logger::error("Failed to start: " + started.error().message);
        return 1;
    }

    pipeline.wait();
    pipeline.stop();
    g_pipeline = nullptr;

    for (const auto& report : pipeline.last_reports()) {
        if (report.outcome == TaskOutcome::Failed) {
            return 1;
        }
    }
    return 0;
}

static int run_controller(const Config& config) {
    GeminiSessionFactory factory;
    EventEmitter events(std::cout);
    auto sink = std::make_shared<ControllerSink>(events);
    auto intake = std::make_shared<ChannelTextIntake>();

    mcp::ToolHostRegistry registry(mcp::ToolClientOptions::from_config(config.tools));
    for (const auto& server : config.tools.servers) {
        auto added = registry.add_server(server);
        if (!added.value("success", false)) {
            Logger::warn("[MCP] Configured server " + server.name + " not started: " +
                         added.value("error", std::string("unknown error")));
        }
    }
    mcp::ToolCallExecutor executor(registry, config.tools.max_concurrent);

    StreamPipeline pipeline(config, factory, PipelineDevices::from_config(config), sink, intake);
    CommandRelay relay(pipeline, *intake, *sink, registry, executor, events);
    g_pipeline = &pipeline;
    g_relay = &relay;

    relay.run(STDIN_FILENO);

    g_relay = nullptr;
    g_pipeline = nullptr;
    return 0;
}

} // namespace live_relay

int main(int argc, char* argv[]) {
    using namespace live_relay;

    Options options;
    if (!parse_args(argc, argv, options)) {
        print_usage(argv[0]);
        return 2;
    }
    if (options.help) {
        print_usage(argv[0]);
        return 0;
    }

    Logger::initialize(LogLevel::INFO);

    if (options.list_devices) {
        audio::list_devices();
        Logger::shutdown();
        return 0;
    }

    std::string config_path = options.config_path.empty() ? default_config_path() : options.config_path;
    Config config = Config::load_from_file(config_path);

    std::string level = options.log_level.empty() ? config.logging.level : options.log_level;
    Logger::shutdown();
    Logger::initialize(Logger::parse_level(level), config.logging.file);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    int result = 0;
    if (options.mode == "controller") {
        result = run_controller(config);
    } else {
        auto mode = parse_video_mode(options.mode);
        if (!mode) {
            Logger::error("Invalid mode '" + options.mode + "'");
            print_usage(argv[0]);
            Logger::shutdown();
            return 2;
        }
        result = run_standalone(config, *mode);
    }

    Logger::shutdown();
    return result;
}
