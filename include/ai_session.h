#pragma once

/**
 * @file ai_session.h
 * @brief Realtime AI session boundary
 *
 * The pipeline talks to the AI service only through these two interfaces.
 * The factory is constructed by main() and injected into the pipeline.
 */

#include "config.h"
#include "core/stop_token.h"
#include "errors.h"
#include "media_types.h"
#include <memory>
#include <optional>
#include <string>

namespace live_relay {

/**
 * @brief One open realtime conversation
 *
 * Send methods may be called concurrently from different tasks.
 * receive() is called from a single task.
 */
class AISession {
public:
    virtual ~AISession() = default;

    virtual Result<void> send_realtime_audio(const AudioChunk& chunk) = 0;
    virtual Result<void> send_realtime_media(const MediaFrame& frame) = 0;

    /**
     * @brief Send a user text turn
     * @param turn_complete true hands the turn to the model
     */
    virtual Result<void> send_client_content(const std::string& text, bool turn_complete) = 0;

    /**
     * @brief Block until the next inbound event
     *
     * A turn is the sequence of AudioData / TextDelta events ending with
     * TurnComplete. Malformed fragments are skipped.
     * @return std::nullopt once the session is closed or stop is requested
     * @throws std::runtime_error when the transport fails
     */
    virtual std::optional<InboundEvent> receive(const StopToken& stop) = 0;

    /// Stop accepting sends and wake receive(). Idempotent.
    virtual void close() = 0;
};

/**
 * @brief Opens sessions with the AI service
 */
class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    virtual Result<std::unique_ptr<AISession>> connect(const SessionConfig& config) = 0;
};

} // namespace live_relay
