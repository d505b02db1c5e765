#pragma once

#include "capture/capture_source.h"
#include <memory>

namespace live_relay {
namespace capture {

/**
 * @brief Gapless 16-bit mono PCM chunks from a PortAudio input stream
 */
class MicrophoneCapture : public MediaCaptureSource {
public:
    MicrophoneCapture(const std::string& device, int sample_rate, int chunk_frames);
    ~MicrophoneCapture() override;

    std::string name() const override { return "microphone"; }
    Result<void> open() override;
    Result<OutboundItem> capture() override;
    void close() override;
    std::chrono::milliseconds interval() const override { return std::chrono::milliseconds(0); }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace capture
} // namespace live_relay
