#include "event_emitter.h"
#include "common.h"
#include "logger.h"

using json = nlohmann::json;

namespace live_relay {

void EventEmitter::emit(const std::string& type, const json& data) {
    json event = {
        {"type", type},
        {"data", data},
        {"timestamp", unix_time_seconds()}
    };
    // Invalid UTF-8 from a tool server must not take the relay down
    std::string line = event.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n' << std::flush;
    if (!out_) {
        Logger::error("[Relay] Failed to write event '" + type + "'");
        out_.clear();
        return;
    }
    emitted_++;
}

void EventEmitter::emit_error(const std::string& message) {
    emit("error", {{"message", message}});
}

void EventEmitter::emit_status(bool running, const std::string& message) {
    emit("status", {{"running", running}, {"message", message}});
}

size_t EventEmitter::emitted_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return emitted_;
}

} // namespace live_relay
