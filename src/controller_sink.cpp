#include "controller_sink.h"
#include "utils.h"

namespace live_relay {

void ControllerSink::on_audio(const Bytes& pcm) {
    events_.emit("audio", {{"data", utils::base64_encode(pcm)}});
}

void ControllerSink::on_text(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transcribing_) {
            transcript_.push_back(text);
        } else {
            events_.emit("text", {{"text", text}});
            return;
        }
    }
    events_.emit("transcription_partial", {{"text", text}});
}

void ControllerSink::on_turn_complete() {
    events_.emit("turn_complete", {{"completed", true}});
}

void ControllerSink::on_frame_captured(const std::string& source) {
    events_.emit(source + "_frame", {{"size", "captured"}});
}

void ControllerSink::on_device_stopped(const std::string& device, const std::string& reason) {
    events_.emit("status", {{"source", device}, {"running", false}, {"message", reason}});
}

void ControllerSink::on_pipeline_stopped(const std::string& reason) {
    events_.emit("status", {
        {"running", false},
        {"message", "Stopped Gemini Live session"},
        {"reason", reason}
    });
}

void ControllerSink::begin_transcription() {
    std::lock_guard<std::mutex> lock(mutex_);
    transcribing_ = true;
    transcript_.clear();
}

std::string ControllerSink::end_transcription() {
    std::lock_guard<std::mutex> lock(mutex_);
    transcribing_ = false;
    std::string text = utils::join(transcript_, " ");
    transcript_.clear();
    return text;
}

bool ControllerSink::is_transcribing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcribing_;
}

} // namespace live_relay
