#pragma once

/**
 * @file response_sink.h
 * @brief Where session output and pipeline notifications go
 *
 * The pipeline is parameterized by one sink: ConsoleSink for standalone use,
 * ControllerSink (controller_sink.h) when a controller drives the process.
 * Callbacks arrive on pipeline task threads; implementations must be
 * thread-safe and must not call StreamPipeline::stop().
 */

#include "common.h"
#include <mutex>
#include <ostream>
#include <string>

namespace live_relay {

class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    /// 24 kHz int16 mono audio from the model
    virtual void on_audio(const Bytes& pcm) = 0;
    virtual void on_text(const std::string& text) = 0;
    virtual void on_turn_complete() = 0;

    /// A camera/screen frame was queued for sending
    virtual void on_frame_captured(const std::string& source) { (void)source; }

    /// A capture or playback device stopped on its own (failure or end of stream)
    virtual void on_device_stopped(const std::string& device, const std::string& reason) {
        (void)device;
        (void)reason;
    }

    /// The pipeline returned to Idle
    virtual void on_pipeline_stopped(const std::string& reason) { (void)reason; }
};

/**
 * @brief Prints model text to a stream; audio is left to local playback
 */
class ConsoleSink : public ResponseSink {
public:
    explicit ConsoleSink(std::ostream& out) : out_(out) {}

    void on_audio(const Bytes&) override {}

    void on_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << text << std::flush;
    }

    void on_turn_complete() override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << std::endl;
    }

    void on_device_stopped(const std::string& device, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "\n[" << device << " stopped: " << reason << "]" << std::endl;
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace live_relay
