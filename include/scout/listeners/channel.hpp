#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace scout::listeners {

/// @brief Thread-safe FIFO used to hand discovery events to a consumer.
///
/// A channel with a non-zero capacity applies backpressure: send() waits
/// while the channel is full. A capacity of zero means unbounded.
template <typename T>
class Channel {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64;

    explicit Channel(size_t capacity = DEFAULT_CAPACITY)
        : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @brief Queues @p value, waiting for room if the channel is full.
    /// @return false if the channel was closed or @p token was stopped before
    /// the value could be queued.
    bool send(T value, std::stop_token token = {}) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_full_.wait(lock, token,
                                    [this] { return closed_ || has_room(); });
        if (!ready || closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    bool try_send(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !has_room()) {
            return false;
        }
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    /// @brief Waits for a value. Returns std::nullopt once the channel is
    /// closed and drained.
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return pop_locked();
    }

    template <typename Rep, typename Period>
    std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout,
                            [this] { return closed_ || !queue_.empty(); });
        return pop_locked();
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    /// @brief Rejects further sends and wakes every waiter. Values already
    /// queued can still be received.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    bool has_room() const { return capacity_ == 0 || queue_.size() < capacity_; }

    std::optional<T> pop_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(queue_.front()));
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_ = false;
};

}  // namespace scout::listeners
