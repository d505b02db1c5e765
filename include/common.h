#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>

namespace live_relay {

// Audio types
using Sample = int16_t;
using Bytes = std::vector<uint8_t>;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

/// Wall-clock seconds since the epoch, fractional (controller event timestamps).
inline double unix_time_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1e6;
}

// Audio format constants
constexpr int SEND_SAMPLE_RATE = 16000;     // microphone -> session
constexpr int RECEIVE_SAMPLE_RATE = 24000;  // session -> speaker
constexpr int CHANNELS = 1;
constexpr int CHUNK_SIZE = 1024;            // frames per microphone read

// Queue sizing
constexpr size_t OUT_QUEUE_CAPACITY = 5;

constexpr const char* APP_NAME = "live_relay";
constexpr const char* APP_VERSION = "1.0.0";

} // namespace live_relay
