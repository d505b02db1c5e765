#pragma once

/**
 * @file stop_token.h
 * @brief Cooperative cancellation flag shared between a pipeline and its tasks
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace live_relay {

/**
 * @brief Copyable handle to a shared stop flag
 *
 * Tasks poll stop_requested() at their suspension points and use wait_for()
 * for cancellable delays. request_stop() wakes every wait_for() caller.
 */
class StopToken {
public:
    StopToken() : state_(std::make_shared<State>()) {}

    bool stop_requested() const {
        return state_->stopped.load(std::memory_order_acquire);
    }

    void request_stop() const {
        state_->stopped.store(true, std::memory_order_release);
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cv.notify_all();
    }

    /**
     * @brief Sleep for the given duration unless stop is requested first
     * @return true if the full duration elapsed, false if stopped
     */
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration, [this] { return stop_requested(); });
    }

private:
    struct State {
        std::atomic<bool> stopped{false};
        std::mutex mutex;
        std::condition_variable cv;
    };
    std::shared_ptr<State> state_;
};

} // namespace live_relay
