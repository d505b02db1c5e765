#pragma once

#include "core/constants.h"
#include "common.h"
#include <map>
#include <string>
#include <vector>

namespace live_relay {

struct SessionConfig {
    std::string model = constants::session::DEFAULT_MODEL;
    std::string endpoint = constants::session::DEFAULT_ENDPOINT;
    std::string api_key;  ///< Overridden by $GEMINI_API_KEY when set
    std::vector<std::string> response_modalities = {"AUDIO", "TEXT"};
    std::string media_resolution = "MEDIA_RESOLUTION_MEDIUM";
    std::string system_instruction;  ///< Optional; omitted from setup when empty
    int connect_timeout_ms = constants::session::CONNECT_TIMEOUT_MS;
    int send_timeout_ms = constants::session::SEND_TIMEOUT_MS;
};

struct AudioConfig {
    std::string input_device;   ///< Name, index or "default"/empty
    std::string output_device;
    int send_sample_rate = SEND_SAMPLE_RATE;
    int receive_sample_rate = RECEIVE_SAMPLE_RATE;
    int chunk_size = CHUNK_SIZE;
    bool local_playback = true;  ///< Play session audio on the local speaker
};

struct CaptureConfig {
    int camera_index = 0;
    int camera_max_dimension = constants::capture::CAMERA_MAX_DIMENSION;
    int screen_max_width = constants::capture::SCREEN_MAX_WIDTH;
    std::string display;  ///< X11 display name (empty = $DISPLAY)
    int frame_interval_ms = constants::capture::FRAME_INTERVAL_MS;
    int jpeg_quality = constants::capture::JPEG_QUALITY;
};

struct PipelineConfig {
    size_t out_queue_capacity = OUT_QUEUE_CAPACITY;
    /// Drop audio still waiting for playback when a turn completes
    bool flush_playback_on_turn_complete = true;
};

/// A tool server launched at startup.
struct ToolServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

struct ToolsConfig {
    int request_timeout_ms = constants::mcp::REQUEST_TIMEOUT_MS;
    int shutdown_grace_ms = constants::mcp::SHUTDOWN_GRACE_MS;
    size_t max_concurrent = constants::mcp::MAX_CONCURRENT_CALLS;
    std::string client_name = APP_NAME;
    std::string client_version = APP_VERSION;
    std::vector<ToolServerConfig> servers;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

struct Config {
    SessionConfig session;
    AudioConfig audio;
    CaptureConfig capture;
    PipelineConfig pipeline;
    ToolsConfig tools;
    LoggingConfig logging;

    /**
     * @brief Load configuration from a JSON file or a directory holding config.json
     *
     * Missing file or keys keep defaults. The API key from the environment
     * wins over the file.
     */
    static Config load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;

    /// Applies $GEMINI_API_KEY when set.
    void apply_environment();
};

} // namespace live_relay
