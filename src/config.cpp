#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

void apply_json_to_config(live_relay::Config& cfg, const json& j) {
    if (j.contains("session") && j["session"].is_object()) {
        const auto& s = j["session"];
        if (s.contains("model") && s["model"].is_string()) cfg.session.model = s["model"];
        if (s.contains("endpoint") && s["endpoint"].is_string()) cfg.session.endpoint = s["endpoint"];
        if (s.contains("api_key") && s["api_key"].is_string()) cfg.session.api_key = s["api_key"];
        if (s.contains("media_resolution") && s["media_resolution"].is_string())
            cfg.session.media_resolution = s["media_resolution"];
        if (s.contains("system_instruction") && s["system_instruction"].is_string())
            cfg.session.system_instruction = s["system_instruction"];
        if (s.contains("connect_timeout_ms") && s["connect_timeout_ms"].is_number_integer())
            cfg.session.connect_timeout_ms = s["connect_timeout_ms"];
        if (s.contains("send_timeout_ms") && s["send_timeout_ms"].is_number_integer())
            cfg.session.send_timeout_ms = s["send_timeout_ms"];
        if (s.contains("response_modalities") && s["response_modalities"].is_array()) {
            cfg.session.response_modalities.clear();
            for (const auto& m : s["response_modalities"])
                if (m.is_string()) cfg.session.response_modalities.push_back(m.get<std::string>());
        }
    }

    if (j.contains("audio") && j["audio"].is_object()) {
        const auto& a = j["audio"];
        if (a.contains("input_device") && a["input_device"].is_string()) cfg.audio.input_device = a["input_device"];
        if (a.contains("output_device") && a["output_device"].is_string()) cfg.audio.output_device = a["output_device"];
        if (a.contains("send_sample_rate") && a["send_sample_rate"].is_number_integer())
            cfg.audio.send_sample_rate = a["send_sample_rate"];
        if (a.contains("receive_sample_rate") && a["receive_sample_rate"].is_number_integer())
            cfg.audio.receive_sample_rate = a["receive_sample_rate"];
        if (a.contains("chunk_size") && a["chunk_size"].is_number_integer()) cfg.audio.chunk_size = a["chunk_size"];
        if (a.contains("local_playback") && a["local_playback"].is_boolean())
            cfg.audio.local_playback = a["local_playback"];
    }

    if (j.contains("capture") && j["capture"].is_object()) {
        const auto& c = j["capture"];
        if (c.contains("camera_index") && c["camera_index"].is_number_integer()) cfg.capture.camera_index = c["camera_index"];
        if (c.contains("camera_max_dimension") && c["camera_max_dimension"].is_number_integer())
            cfg.capture.camera_max_dimension = c["camera_max_dimension"];
        if (c.contains("screen_max_width") && c["screen_max_width"].is_number_integer())
            cfg.capture.screen_max_width = c["screen_max_width"];
        if (c.contains("display") && c["display"].is_string()) cfg.capture.display = c["display"];
        if (c.contains("frame_interval_ms") && c["frame_interval_ms"].is_number_integer())
            cfg.capture.frame_interval_ms = c["frame_interval_ms"];
        if (c.contains("jpeg_quality") && c["jpeg_quality"].is_number_integer()) cfg.capture.jpeg_quality = c["jpeg_quality"];
    }

    if (j.contains("pipeline") && j["pipeline"].is_object()) {
        const auto& p = j["pipeline"];
        if (p.contains("out_queue_capacity") && p["out_queue_capacity"].is_number_unsigned())
            cfg.pipeline.out_queue_capacity = p["out_queue_capacity"];
        if (p.contains("flush_playback_on_turn_complete") && p["flush_playback_on_turn_complete"].is_boolean())
            cfg.pipeline.flush_playback_on_turn_complete = p["flush_playback_on_turn_complete"];
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        const auto& t = j["tools"];
        if (t.contains("request_timeout_ms") && t["request_timeout_ms"].is_number_integer())
            cfg.tools.request_timeout_ms = t["request_timeout_ms"];
        if (t.contains("shutdown_grace_ms") && t["shutdown_grace_ms"].is_number_integer())
            cfg.tools.shutdown_grace_ms = t["shutdown_grace_ms"];
        if (t.contains("max_concurrent") && t["max_concurrent"].is_number_unsigned())
            cfg.tools.max_concurrent = t["max_concurrent"];
        if (t.contains("client_name") && t["client_name"].is_string()) cfg.tools.client_name = t["client_name"];
        if (t.contains("client_version") && t["client_version"].is_string()) cfg.tools.client_version = t["client_version"];
        if (t.contains("servers") && t["servers"].is_array()) {
            cfg.tools.servers.clear();
            for (const auto& s : t["servers"]) {
                if (!s.is_object() || !s.contains("name") || !s["name"].is_string() ||
                    !s.contains("command") || !s["command"].is_string()) {
                    live_relay::Logger::warn("Skipping tool server entry without name/command");
                    continue;
                }
                live_relay::ToolServerConfig server;
                server.name = s["name"].get<std::string>();
                server.command = s["command"].get<std::string>();
                if (s.contains("args") && s["args"].is_array()) {
                    for (const auto& arg : s["args"])
                        if (arg.is_string()) server.args.push_back(arg.get<std::string>());
                }
                if (s.contains("env") && s["env"].is_object()) {
                    for (auto it = s["env"].begin(); it != s["env"].end(); ++it)
                        if (it.value().is_string()) server.env[it.key()] = it.value().get<std::string>();
                }
                cfg.tools.servers.push_back(server);
            }
        }
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& l = j["logging"];
        if (l.contains("level") && l["level"].is_string()) cfg.logging.level = l["level"];
        if (l.contains("file") && l["file"].is_string()) cfg.logging.file = l["file"];
    }
}

} // anonymous namespace

namespace live_relay {

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::string file_path = expand_path(path);
    std::error_code ec;
    if (fs::is_directory(file_path, ec) && !ec) {
        file_path = (fs::path(file_path) / "config.json").string();
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + file_path + ". Using defaults.");
    } else {
        json j;
        try {
            file >> j;
            apply_json_to_config(cfg, j);
            Logger::info("Loaded config: " + file_path);
        } catch (const json::exception& e) {
            Logger::error("Error parsing config JSON: " + std::string(e.what()));
        }
    }

    if (!cfg.logging.file.empty()) cfg.logging.file = expand_path(cfg.logging.file);
    for (auto& server : cfg.tools.servers) {
        server.command = expand_path(server.command);
    }

    cfg.apply_environment();
    return cfg;
}

void Config::apply_environment() {
    const char* key = std::getenv(constants::session::API_KEY_ENV);
    if (key && *key) {
        session.api_key = key;
    }
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["session"]["model"] = session.model;
    j["session"]["endpoint"] = session.endpoint;
    j["session"]["response_modalities"] = session.response_modalities;
    j["session"]["media_resolution"] = session.media_resolution;
    if (!session.system_instruction.empty()) j["session"]["system_instruction"] = session.system_instruction;
    j["session"]["connect_timeout_ms"] = session.connect_timeout_ms;
    j["session"]["send_timeout_ms"] = session.send_timeout_ms;
    // api_key is never written back; it belongs in the environment

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["send_sample_rate"] = audio.send_sample_rate;
    j["audio"]["receive_sample_rate"] = audio.receive_sample_rate;
    j["audio"]["chunk_size"] = audio.chunk_size;
    j["audio"]["local_playback"] = audio.local_playback;

    j["capture"]["camera_index"] = capture.camera_index;
    j["capture"]["camera_max_dimension"] = capture.camera_max_dimension;
    j["capture"]["screen_max_width"] = capture.screen_max_width;
    j["capture"]["display"] = capture.display;
    j["capture"]["frame_interval_ms"] = capture.frame_interval_ms;
    j["capture"]["jpeg_quality"] = capture.jpeg_quality;

    j["pipeline"]["out_queue_capacity"] = pipeline.out_queue_capacity;
    j["pipeline"]["flush_playback_on_turn_complete"] = pipeline.flush_playback_on_turn_complete;

    j["tools"]["request_timeout_ms"] = tools.request_timeout_ms;
    j["tools"]["shutdown_grace_ms"] = tools.shutdown_grace_ms;
    j["tools"]["max_concurrent"] = tools.max_concurrent;
    j["tools"]["client_name"] = tools.client_name;
    j["tools"]["client_version"] = tools.client_version;
    j["tools"]["servers"] = json::array();
    for (const auto& server : tools.servers) {
        json s;
        s["name"] = server.name;
        s["command"] = server.command;
        s["args"] = server.args;
        s["env"] = server.env;
        j["tools"]["servers"].push_back(s);
    }

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    file << j.dump(2) << std::endl;
}

} // namespace live_relay
