#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include "cancellation.hpp"
#include "types/result.hpp"

namespace rangestream {

/// @brief Bounded multi-producer multi-consumer queue with close and cancellation
///
/// Behaviour:
/// - push() blocks while the channel is full
/// - pop() blocks while the channel is empty and open
/// - Both return the cancellation cause as soon as the attached source is
///   cancelled, even if progress would otherwise be possible
/// - close() is one-way: pushes are rejected with ChannelClosed, pops drain the
///   remaining items and then report closure with std::nullopt
///
/// @tparam T Item type, only needs to be move constructible
/// @note Thread-safe: any number of threads may push and pop concurrently
template <typename T>
class Channel {
public:
    /// @param capacity Maximum number of queued items (clamped to at least 1)
    /// @param cancel Optional cancellation source observed by every blocking call.
    ///               Must outlive the channel.
    explicit Channel(std::size_t capacity, CancellationSource* cancel = nullptr)
        : capacity_(std::max<std::size_t>(capacity, 1)), cancel_(cancel) {
        if (cancel_ != nullptr) {
            // Cancellation flips a flag the wait predicates read, wake them up.
            // Taking the mutex orders the notification after any predicate check in flight.
            subscription_ = cancel_->subscribe([this] {
                { std::lock_guard lock(mutex_); }
                not_empty_.notify_all();
                not_full_.notify_all();
            });
        }
    }

    ~Channel() {
        if (cancel_ != nullptr) {
            cancel_->unsubscribe(subscription_);
        }
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @brief Enqueue an item, blocking while the channel is full
    /// @param value Moved from only when the push succeeds
    /// @retval Cancelled (or the cancellation cause) Source cancelled while waiting
    /// @retval ChannelClosed Channel was closed
    [[nodiscard]] Result<void> push(T&& value) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] {
            return is_cancelled() || closed_ || items_.size() < capacity_;
        });

        if (is_cancelled()) {
            return cancel_->status();
        }
        if (closed_) {
            return Err(Error::Code::ChannelClosed, "Push on closed channel");
        }

        items_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return Ok();
    }

    /// @brief Dequeue an item, blocking while the channel is empty and open
    /// @return The item, or std::nullopt once the channel is closed and drained
    [[nodiscard]] Result<std::optional<T>> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] {
            return is_cancelled() || closed_ || !items_.empty();
        });
        return take_locked(lock);
    }

    /// @brief Same as pop() with a deadline
    /// @retval Timeout Deadline passed before an item arrived
    template <typename Clock, typename Duration>
    [[nodiscard]] Result<std::optional<T>> pop_until(
        const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock lock(mutex_);
        bool ready = not_empty_.wait_until(lock, deadline, [this] {
            return is_cancelled() || closed_ || !items_.empty();
        });
        if (!ready) {
            return Err(Error::Code::Timeout, "Deadline exceeded while waiting on channel");
        }
        return take_locked(lock);
    }

    /// @brief Close the channel
    /// @return true if this call closed it, false if it was already closed
    bool close() {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        return true;
    }

    /// @brief Remove and return every queued item, ignoring cancellation
    [[nodiscard]] std::deque<T> drain() {
        std::deque<T> out;
        {
            std::lock_guard lock(mutex_);
            out.swap(items_);
        }
        not_full_.notify_all();
        return out;
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

private:
    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancel_ != nullptr && cancel_->is_cancelled();
    }

    Result<std::optional<T>> take_locked(std::unique_lock<std::mutex>& lock) {
        if (is_cancelled()) {
            return cancel_->status().error();
        }
        if (items_.empty()) {
            return Ok(std::optional<T>{});  // closed and drained
        }

        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return Result<std::optional<T>>{std::move(item)};
    }

    const std::size_t capacity_;
    CancellationSource* cancel_;
    std::size_t subscription_{0};

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace rangestream
