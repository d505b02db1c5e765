#pragma once

/**
 * @file gemini_live_session.h
 * @brief Gemini Live session over a libcurl websocket
 */

#include "ai_session.h"
#include <memory>

namespace live_relay {

class GeminiLiveSession : public AISession {
    class Impl;
    struct PrivateTag {};

public:
    /**
     * @brief Open the websocket, send setup and wait for setupComplete
     */
    static Result<std::unique_ptr<AISession>> connect(const SessionConfig& config);

    /// Reachable only through connect()
    GeminiLiveSession(PrivateTag, std::unique_ptr<Impl> impl);
    ~GeminiLiveSession() override;

    GeminiLiveSession(const GeminiLiveSession&) = delete;
    GeminiLiveSession& operator=(const GeminiLiveSession&) = delete;

    Result<void> send_realtime_audio(const AudioChunk& chunk) override;
    Result<void> send_realtime_media(const MediaFrame& frame) override;
    Result<void> send_client_content(const std::string& text, bool turn_complete) override;
    std::optional<InboundEvent> receive(const StopToken& stop) override;
    void close() override;

private:
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Factory handed to the pipeline in production
 */
class GeminiSessionFactory : public SessionFactory {
public:
    GeminiSessionFactory();
    ~GeminiSessionFactory() override;

    Result<std::unique_ptr<AISession>> connect(const SessionConfig& config) override;
};

} // namespace live_relay
