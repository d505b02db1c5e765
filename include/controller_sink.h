#pragma once

#include "event_emitter.h"
#include "response_sink.h"
#include <mutex>
#include <string>
#include <vector>

namespace live_relay {

/**
 * @brief ResponseSink that relays session output as controller events
 *
 * In transcription mode model text is collected and reported as
 * transcription_partial instead of text.
 */
class ControllerSink : public ResponseSink {
public:
    explicit ControllerSink(EventEmitter& events) : events_(events) {}

    void on_audio(const Bytes& pcm) override;
    void on_text(const std::string& text) override;
    void on_turn_complete() override;
    void on_frame_captured(const std::string& source) override;
    void on_device_stopped(const std::string& device, const std::string& reason) override;
    void on_pipeline_stopped(const std::string& reason) override;

    /// Enable transcription mode with an empty buffer
    void begin_transcription();

    /// Leave transcription mode; returns the collected text joined by spaces
    std::string end_transcription();

    bool is_transcribing() const;

private:
    EventEmitter& events_;
    mutable std::mutex mutex_;
    bool transcribing_ = false;
    std::vector<std::string> transcript_;
};

} // namespace live_relay
