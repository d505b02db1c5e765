#pragma once

#include "capture/capture_source.h"
#include <memory>

namespace live_relay {
namespace capture {

/**
 * @brief Camera frames via OpenCV VideoCapture, thumbnailed and JPEG-encoded
 */
class CameraCapture : public MediaCaptureSource {
public:
    CameraCapture(int device_index, int max_dimension, int jpeg_quality,
                  std::chrono::milliseconds interval);
    ~CameraCapture() override;

    std::string name() const override { return "camera"; }
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
