#pragma once

/**
 * @file gemini_protocol.h
 * @brief JSON messages of the Gemini Live (BidiGenerateContent) websocket protocol
 *
 * Pure encode/decode; no I/O.
 */

#include "config.h"
#include "errors.h"
#include "media_types.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace live_relay {
namespace gemini {

/// wss endpoint with the API key as query parameter.
std::string build_endpoint_url(const SessionConfig& config);

nlohmann::json build_setup_message(const SessionConfig& config);
nlohmann::json build_audio_input(const AudioChunk& chunk);
nlohmann::json build_media_input(const MediaFrame& frame);
nlohmann::json build_client_content(const std::string& text, bool turn_complete);

/**
 * @brief Decoded server frame
 */
struct ServerMessage {
    bool setup_complete = false;
    bool go_away = false;           ///< server will close the connection soon
    std::vector<InboundEvent> events;
};

/**
 * @brief Decode one server frame
 *
 * Parts with missing or wrongly typed fields are skipped; the rest of the
 * frame is still decoded.
 * @return ParseError if the frame is not a JSON object
 */
Result<ServerMessage> parse_server_message(const std::string& raw);

} // namespace gemini
} // namespace live_relay
