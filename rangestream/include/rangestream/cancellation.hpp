#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>
#include "types/result.hpp"

namespace rangestream {

/// @brief Shared cancellation signal carrying a cause
///
/// The first call to cancel() wins: its error becomes the cause and every
/// later call is a no-op. Once cancelled, the source stays cancelled.
///
/// Synchronization:
/// - cancelled_ is the lock-free fast path used at every suspension point
/// - cause_ is written once under mutex_ before cancelled_ is published, so
///   readers that observed cancelled_ == true may read it without locking
/// - Subscribers are invoked under mutex_, which makes unsubscribe() a barrier:
///   once it returns, the callback is not running and will never run again
///
/// @note Thread-safe: all methods may be called concurrently
class CancellationSource {
public:
    using Callback = std::function<void()>;

    CancellationSource() noexcept = default;

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    /// @brief Cancel with the given cause
    /// @return true if this call cancelled the source, false if it was already cancelled
    bool cancel(Error cause) {
        {
            std::lock_guard lock(mutex_);
            if (cancelled_.load(std::memory_order_relaxed)) {
                return false;
            }
            cause_.emplace(std::move(cause));
            cancelled_.store(true, std::memory_order_release);

            for (auto& entry : callbacks_) {
                entry.second();
            }
        }
        cv_.notify_all();
        return true;
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// @brief The cancellation cause, if cancelled
    [[nodiscard]] std::optional<Error> cause() const {
        if (!is_cancelled()) {
            return std::nullopt;
        }
        return cause_;
    }

    /// @brief Ok while running, the cause once cancelled
    [[nodiscard]] Result<void> status() const {
        if (!is_cancelled()) {
            return Ok();
        }
        return *cause_;
    }

    /// @brief Sleep until cancelled or until the duration expires
    /// @return true if the source is cancelled
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, duration, [this] {
            return cancelled_.load(std::memory_order_acquire);
        });
    }

    /// @brief Block until cancelled
    void wait() const {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return cancelled_.load(std::memory_order_acquire); });
    }

    /// @brief Register a callback invoked once on cancellation
    /// @note If already cancelled, the callback runs immediately on the calling thread
    /// @note Callbacks run under the source lock: they may read cause() but must not
    ///       call cancel(), subscribe() or unsubscribe() on this source
    /// @return Subscription id for unsubscribe()
    std::size_t subscribe(Callback callback) {
        std::lock_guard lock(mutex_);
        std::size_t id = next_id_++;
        if (cancelled_.load(std::memory_order_relaxed)) {
            callback();
            return id;
        }
        callbacks_.emplace_back(id, std::move(callback));
        return id;
    }

    void unsubscribe(std::size_t id) {
        std::lock_guard lock(mutex_);
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->first == id) {
                callbacks_.erase(it);
                return;
            }
        }
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    std::optional<Error> cause_;
    std::vector<std::pair<std::size_t, Callback>> callbacks_;
    std::size_t next_id_{1};
};

/// @brief Read-only view of a CancellationSource handed to range sources
///
/// A default-constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() noexcept = default;

    explicit CancellationToken(const CancellationSource& source) noexcept
        : source_(&source) {}

    [[nodiscard]] bool is_cancelled() const noexcept {
        return source_ != nullptr && source_->is_cancelled();
    }

    [[nodiscard]] Result<void> status() const {
        if (source_ == nullptr) {
            return Ok();
        }
        return source_->status();
    }

    /// @brief Sleep for the duration unless cancelled first
    /// @return true if cancelled
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        if (source_ == nullptr) {
            std::this_thread::sleep_for(duration);
            return false;
        }
        return source_->wait_for(duration);
    }

private:
    const CancellationSource* source_{nullptr};
};

} // namespace rangestream
