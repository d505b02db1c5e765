#include "gemini_protocol.h"
#include "logger.h"
#include "utils.h"

using json = nlohmann::json;

namespace live_relay {
namespace gemini {

std::string build_endpoint_url(const SessionConfig& config) {
    std::string url = config.endpoint;
    if (!config.api_key.empty()) {
        url += (url.find('?') == std::string::npos ? "?key=" : "&key=");
        url += config.api_key;
    }
    return url;
}

json build_setup_message(const SessionConfig& config) {
    json generation_config;
    generation_config["responseModalities"] = config.response_modalities;
    if (!config.media_resolution.empty()) {
        generation_config["mediaResolution"] = config.media_resolution;
    }

    json setup;
    setup["model"] = config.model;
    setup["generationConfig"] = generation_config;
    if (!config.system_instruction.empty()) {
        setup["systemInstruction"] = {{"parts", json::array({{{"text", config.system_instruction}}})}};
    }
    return {{"setup", setup}};
}

json build_audio_input(const AudioChunk& chunk) {
    json blob = {
        {"mimeType", "audio/pcm;rate=" + std::to_string(chunk.sample_rate)},
        {"data", utils::base64_encode(chunk.pcm)}
    };
    return {{"realtimeInput", {{"audio", blob}}}};
}

json build_media_input(const MediaFrame& frame) {
    json blob = {
        {"mimeType", frame.mime_type},
        {"data", utils::base64_encode(frame.payload)}
    };
    return {{"realtimeInput", {{"video", blob}}}};
}

json build_client_content(const std::string& text, bool turn_complete) {
    json part = {{"text", text}};
    json turn = {{"role", "user"}, {"parts", json::array({part})}};
    return {{"clientContent", {{"turns", json::array({turn})}, {"turnComplete", turn_complete}}}};
}

namespace {

void decode_parts(const json& parts, std::vector<InboundEvent>& events) {
    for (const auto& part : parts) {
        if (!part.is_object()) continue;

        if (part.contains("inlineData")) {
            const auto& inline_data = part["inlineData"];
            if (!inline_data.is_object() || !inline_data.contains("data") || !inline_data["data"].is_string()) {
                Logger::warn("[Session] Skipping inlineData without data");
                continue;
            }
            auto decoded = utils::base64_decode(inline_data["data"].get<std::string>());
            if (!decoded) {
                Logger::warn("[Session] Skipping inlineData with invalid base64");
                continue;
            }
            if (!decoded->empty()) {
                events.push_back(AudioData{std::move(*decoded)});
            }
            continue;
        }

        if (part.contains("text") && part["text"].is_string()) {
            std::string text = part["text"].get<std::string>();
            if (!text.empty()) {
                events.push_back(TextDelta{text});
            }
        }
    }
}

} // namespace

Result<ServerMessage> parse_server_message(const std::string& raw) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::exception& e) {
        return make_parse_error(std::string("Invalid server frame: ") + e.what());
    }
    if (!j.is_object()) {
        return make_parse_error("Server frame is not an object");
    }

    ServerMessage message;
    if (j.contains("setupComplete")) {
        message.setup_complete = true;
    }
    if (j.contains("goAway")) {
        message.go_away = true;
    }

    if (j.contains("serverContent") && j["serverContent"].is_object()) {
        const auto& content = j["serverContent"];

        if (content.contains("interrupted") && content["interrupted"].is_boolean() &&
            content["interrupted"].get<bool>()) {
            message.events.push_back(Interrupted{});
        }

        if (content.contains("modelTurn") && content["modelTurn"].is_object()) {
            const auto& model_turn = content["modelTurn"];
            if (model_turn.contains("parts") && model_turn["parts"].is_array()) {
                decode_parts(model_turn["parts"], message.events);
            }
        }

        if (content.contains("turnComplete") && content["turnComplete"].is_boolean() &&
            content["turnComplete"].get<bool>()) {
            message.events.push_back(TurnComplete{});
        }
    }

    return message;
}

} // namespace gemini
} // namespace live_relay
