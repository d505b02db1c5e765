#pragma once

/**
 * @file capture_source.h
 * @brief Capture device interface
 *
 * One implementation per modality (camera, screen, microphone). The pipeline
 * drives a source from a single task thread: open(), repeated capture(),
 * close(). Implementations need not be thread-safe.
 */

#include "errors.h"
#include "media_types.h"
#include <chrono>
#include <string>

namespace live_relay {
namespace capture {

/**
 * @brief Abstract capture device
 */
class MediaCaptureSource {
public:
    virtual ~MediaCaptureSource() = default;

    /// "camera", "screen" or "microphone"; used in logs and sink events.
    virtual std::string name() const = 0;

    /**
     * @brief Acquire the device
     * @return error describing why the device could not be opened
     */
    virtual Result<void> open() = 0;

    /**
     * @brief Capture one item (blocking until the device delivers it)
     * @return the item, or an error on device failure / end of stream
     */
    virtual Result<OutboundItem> capture() = 0;

    /// Release the device. Safe to call more than once.
    virtual void close() = 0;

    /// Delay between captures; zero for gapless sources.
    virtual std::chrono::milliseconds interval() const = 0;
};

} // namespace capture
} // namespace live_relay
