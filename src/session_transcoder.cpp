#include "session_transcoder.h"
#include "utils.h"
#include <type_traits>

namespace live_relay {

Result<void> SessionTranscoder::forward(const OutboundItem& item, AISession& session) {
    return std::visit([&session](const auto& value) -> Result<void> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, AudioChunk>) {
            return session.send_realtime_audio(value);
        } else {
            return session.send_realtime_media(value);
        }
    }, item);
}

const char* SessionTranscoder::kind(const OutboundItem& item) {
    return std::holds_alternative<AudioChunk>(item) ? "audio" : "media";
}

Result<MediaFrame> SessionTranscoder::frame_from_base64(const std::string& mime_type, const std::string& data) {
    if (mime_type.empty()) {
        return make_parse_error("Image is missing mime_type");
    }
    auto decoded = utils::base64_decode(data);
    if (!decoded) {
        return make_parse_error("Image data is not valid base64");
    }
    MediaFrame frame;
    frame.mime_type = mime_type;
    frame.payload = std::move(*decoded);
    frame.captured_at = std::chrono::steady_clock::now();
    return frame;
}

} // namespace live_relay
