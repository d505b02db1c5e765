#pragma once

/**
 * @file bounded_channel.h
 * @brief Blocking FIFO channel with fixed capacity and close semantics
 *
 * Used for:
 * - The outbound queue between capture sources and the session sender
 * - The playback queue between the receiver and the audio player (unbounded)
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace live_relay {

/**
 * @brief Multi-producer multi-consumer FIFO channel
 *
 * put() blocks while the channel is full, get() blocks while it is empty.
 * Waiters are served in FIFO order of the items, never dropped by the channel.
 * After close(), put() fails immediately and get() keeps returning items
 * until the channel is empty, then returns std::nullopt.
 */
template<typename T>
class BoundedChannel {
public:
    /// Capacity 0 means unbounded.
    static constexpr size_t UNBOUNDED = 0;

    explicit BoundedChannel(size_t capacity)
        : capacity_(capacity), closed_(false) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Enqueue an item, blocking while the channel is at capacity
     * @return false if the channel was closed (item not enqueued)
     */
    bool put(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || !at_capacity(); });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Enqueue without blocking
     * @return false if full or closed
     */
    bool try_put(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || at_capacity()) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Dequeue the oldest item, blocking while empty
     * @return std::nullopt once the channel is closed and drained
     */
    std::optional<T> get() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Dequeue without blocking
     */
    std::optional<T> try_get() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Discard every pending item
     * @return number of items discarded
     */
    size_t drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t discarded = items_.size();
        items_.clear();
        not_full_.notify_all();
        return discarded;
    }

    /**
     * @brief Close the channel and wake every blocked caller
     */
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

private:
    bool at_capacity() const {
        return capacity_ != UNBOUNDED && items_.size() >= capacity_;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_;
};

} // namespace live_relay
