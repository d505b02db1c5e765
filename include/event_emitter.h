#pragma once

/**
 * @file event_emitter.h
 * @brief Event lines for the controller: {"type", "data", "timestamp"}
 */

#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace live_relay {

/**
 * @brief Writes one JSON object per line and flushes
 *
 * Shared by the command loop, pipeline tasks and tool-call workers; lines
 * never interleave.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out) : out_(out) {}

    void emit(const std::string& type, const nlohmann::json& data = nlohmann::json::object());

    /// Shorthand for emit("error", {"message": message})
    void emit_error(const std::string& message);

    /// Shorthand for emit("status", {"running": running, "message": message})
    void emit_status(bool running, const std::string& message);

    size_t emitted_count() const;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    size_t emitted_ = 0;
};

} // namespace live_relay
