#include "media_types.h"
#include "utils.h"

namespace live_relay {

const char* video_mode_name(VideoMode mode) {
    switch (mode) {
        case VideoMode::None:   return "none";
        case VideoMode::Camera: return "camera";
        case VideoMode::Screen: return "screen";
        default: return "unknown";
    }
}

std::optional<VideoMode> parse_video_mode(const std::string& name) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "none") return VideoMode::None;
    if (n == "camera") return VideoMode::Camera;
    if (n == "screen") return VideoMode::Screen;
    return std::nullopt;
}

} // namespace live_relay
