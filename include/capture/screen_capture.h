#pragma once

#include "capture/capture_source.h"
#include <memory>

namespace live_relay {
namespace capture {

/**
 * @brief Full-desktop grabs of the X11 root window, width-capped and JPEG-encoded
 */
class ScreenCapture : public MediaCaptureSource {
public:
    /// display_name empty = $DISPLAY
    ScreenCapture(const std::string& display_name, int max_width, int jpeg_quality,
                  std::chrono::milliseconds interval);
    ~ScreenCapture() override;

    std::string name() const override { return "screen"; }
    Result<void> open() override;
    Result<OutboundItem> capture() override;
    void close() override;
    std::chrono::milliseconds interval() const override { return interval_; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
    std::chrono::milliseconds interval_;
};

} // namespace capture
} // namespace live_relay
