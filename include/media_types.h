#pragma once

/**
 * @file media_types.h
 * @brief Units that flow through the streaming pipeline
 */

#include "common.h"
#include <optional>
#include <string>
#include <variant>

namespace live_relay {

/**
 * @brief One encoded still image (camera, screen or controller upload)
 */
struct MediaFrame {
    std::string mime_type;
    Bytes payload;  ///< encoded bytes (e.g. JPEG), not base64
    TimePoint captured_at;
};

/**
 * @brief Fixed-size block of 16-bit mono PCM from the microphone
 */
struct AudioChunk {
    Bytes pcm;  ///< little-endian int16 samples
    int sample_rate = SEND_SAMPLE_RATE;
};

/// Unit placed on the outbound queue.
using OutboundItem = std::variant<AudioChunk, MediaFrame>;

// Inbound events produced by the session receive loop
struct AudioData {
    Bytes pcm;  ///< 24 kHz int16 mono
};

struct TextDelta {
    std::string text;
};

struct TurnComplete {};

/// Server-side barge-in: the model stopped its turn because the user spoke.
struct Interrupted {};

using InboundEvent = std::variant<AudioData, TextDelta, TurnComplete, Interrupted>;

/**
 * @brief Operator input handed to the intake task
 */
struct ClientTurn {
    std::optional<std::string> text;
    std::optional<MediaFrame> image;
};

enum class VideoMode {
    None,
    Camera,
    Screen
};

const char* video_mode_name(VideoMode mode);

/// Parses "none" | "camera" | "screen".
std::optional<VideoMode> parse_video_mode(const std::string& name);

} // namespace live_relay
