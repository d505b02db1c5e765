#pragma once

/**
 * @file session_transcoder.h
 * @brief Routes outbound queue items to the matching session call
 */

#include "ai_session.h"
#include "errors.h"
#include "media_types.h"
#include <optional>
#include <string>

namespace live_relay {

class SessionTranscoder {
public:
    /**
     * @brief Send one item: AudioChunk -> send_realtime_audio, MediaFrame -> send_realtime_media
     */
    static Result<void> forward(const OutboundItem& item, AISession& session);

    /// "audio" or "media", for logs.
    static const char* kind(const OutboundItem& item);

    /**
     * @brief Build a MediaFrame from a base64 payload (controller image uploads)
     * @return ParseError on invalid base64 or empty mime type
     */
    static Result<MediaFrame> frame_from_base64(const std::string& mime_type, const std::string& data);
};

} // namespace live_relay
