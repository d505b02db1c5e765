#pragma once

/**
 * @file text_intake.h
 * @brief Source of operator turns for the pipeline's primary task
 */

#include "core/bounded_channel.h"
#include "core/stop_token.h"
#include "line_reader.h"
#include "media_types.h"
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>

namespace live_relay {

class TextIntake {
public:
    virtual ~TextIntake() = default;

    /// Called by the pipeline before a session's tasks start.
    virtual void begin() {}

    /**
     * @brief Block for the next operator turn
     * @return std::nullopt when the operator quit, the source closed,
     *         cancel() was called or stop was requested
     */
    virtual std::optional<ClientTurn> next(const StopToken& stop) = 0;

    /// Wake a blocked next(). Called by the pipeline during teardown.
    virtual void cancel() {}
};

/**
 * @brief Terminal prompt: one line per turn, "q" quits
 *
 * Reads the file descriptor directly with poll() so a blocked read still
 * observes the stop token.
 */
class ConsoleTextIntake : public TextIntake {
public:
    ConsoleTextIntake(int input_fd, std::ostream& prompt_out);

    std::optional<ClientTurn> next(const StopToken& stop) override;

private:
    LineReader reader_;
    std::ostream& prompt_out_;
};

/**
 * @brief Turns submitted by the controller relay
 *
 * Each begin() opens a fresh channel, so turns submitted while no session
 * runs are rejected rather than replayed into the next session.
 */
class ChannelTextIntake : public TextIntake {
public:
    ChannelTextIntake();

    void begin() override;
    std::optional<ClientTurn> next(const StopToken& stop) override;
    void cancel() override;

    /// @return false when no session is accepting turns
    bool submit(ClientTurn turn);

private:
    std::shared_ptr<BoundedChannel<ClientTurn>> current() const;

    mutable std::mutex mutex_;
    std::shared_ptr<BoundedChannel<ClientTurn>> channel_;
};

} // namespace live_relay
