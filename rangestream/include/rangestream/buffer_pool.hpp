#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <vector>
#include "types/result.hpp"

namespace rangestream {

class BufferPool;

/// @brief Move-only handle to a pool-owned byte buffer
///
/// A handle owns its buffer until it is released back to the pool, either
/// explicitly through BufferPool::release() or by the handle's destructor.
/// A released (or moved-from) handle is empty and owns nothing.
class BufferHandle {
public:
    BufferHandle() noexcept = default;

    ~BufferHandle();

    BufferHandle(BufferHandle&& other) noexcept
        : pool_(other.pool_), storage_(std::move(other.storage_)), capacity_(other.capacity_) {
        other.pool_ = nullptr;
        other.capacity_ = 0;
    }

    BufferHandle& operator=(BufferHandle&& other) noexcept;

    BufferHandle(const BufferHandle&) = delete;
    BufferHandle& operator=(const BufferHandle&) = delete;

    [[nodiscard]] std::span<std::byte> span() noexcept {
        return {storage_.get(), capacity_};
    }

    [[nodiscard]] std::span<const std::byte> span() const noexcept {
        return {storage_.get(), capacity_};
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return storage_ == nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return storage_ != nullptr; }

    /// @brief Return the buffer to its pool now (no-op on an empty handle)
    void reset() noexcept;

private:
    friend class BufferPool;

    BufferHandle(BufferPool* pool, std::unique_ptr<std::byte[]> storage, std::size_t capacity) noexcept
        : pool_(pool), storage_(std::move(storage)), capacity_(capacity) {}

    BufferPool* pool_{nullptr};
    std::unique_ptr<std::byte[]> storage_;
    std::size_t capacity_{0};
};

/// @brief Thread-safe recycling pool of fixed-size byte buffers
///
/// acquire() hands out a recycled buffer when one is free and allocates a new
/// one otherwise, so acquisition never waits. Buffers come back through
/// release() or through the destructor of their handle.
///
/// Ownership:
/// - The pool owns every buffer at rest (free list)
/// - A handle owns its buffer exclusively while it is checked out
/// - A buffer returns to the free list exactly once per acquisition
///
/// @note The pool must outlive every handle it has produced
/// @note Thread-safe: acquire() and release() may be called concurrently
class BufferPool {
public:
    explicit BufferPool(std::size_t buffer_size) noexcept
        : buffer_size_(buffer_size) {}

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /// @brief Take a buffer of capacity buffer_size()
    /// @throws std::bad_alloc if a new buffer cannot be allocated
    [[nodiscard]] BufferHandle acquire() {
        {
            std::lock_guard lock(mutex_);
            if (!free_.empty()) {
                auto storage = std::move(free_.back());
                free_.pop_back();
                outstanding_.fetch_add(1, std::memory_order_relaxed);
                return BufferHandle(this, std::move(storage), buffer_size_);
            }
        }

        // Allocate outside the lock
        auto storage = std::make_unique<std::byte[]>(buffer_size_);
        allocated_.fetch_add(1, std::memory_order_relaxed);
        outstanding_.fetch_add(1, std::memory_order_relaxed);
        return BufferHandle(this, std::move(storage), buffer_size_);
    }

    /// @brief Return a buffer to the pool
    /// @retval InvalidOperation The handle is empty (already released or moved from)
    /// @retval InvalidArgument The handle belongs to another pool
    [[nodiscard]] Result<void> release(BufferHandle&& handle) noexcept {
        if (handle.empty()) {
            return Err(Error::Code::InvalidOperation, "Buffer already released");
        }
        if (handle.pool_ != this) {
            return Err(Error::Code::InvalidArgument, "Buffer does not belong to this pool");
        }
        recycle(std::move(handle.storage_));
        handle.pool_ = nullptr;
        handle.capacity_ = 0;
        return Ok();
    }

    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_size_; }

    /// @brief Number of buffers currently at rest in the pool
    [[nodiscard]] std::size_t free_count() const {
        std::lock_guard lock(mutex_);
        return free_.size();
    }

    /// @brief Number of buffers ever allocated by this pool
    [[nodiscard]] std::size_t allocated_count() const noexcept {
        return allocated_.load(std::memory_order_relaxed);
    }

    /// @brief Number of buffers currently checked out
    [[nodiscard]] std::size_t outstanding() const noexcept {
        return outstanding_.load(std::memory_order_relaxed);
    }

private:
    friend class BufferHandle;

    void recycle(std::unique_ptr<std::byte[]> storage) noexcept {
        std::lock_guard lock(mutex_);
        try {
            free_.push_back(std::move(storage));
        } catch (const std::bad_alloc&) {
            // Free list could not grow, the buffer is simply freed
        }
        outstanding_.fetch_sub(1, std::memory_order_relaxed);
    }

    const std::size_t buffer_size_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<std::byte[]>> free_;
    std::atomic<std::size_t> allocated_{0};
    std::atomic<std::size_t> outstanding_{0};
};

inline BufferHandle::~BufferHandle() {
    reset();
}

inline BufferHandle& BufferHandle::operator=(BufferHandle&& other) noexcept {
    if (this != &other) {
        reset();
        pool_ = other.pool_;
        storage_ = std::move(other.storage_);
        capacity_ = other.capacity_;
        other.pool_ = nullptr;
        other.capacity_ = 0;
    }
    return *this;
}

inline void BufferHandle::reset() noexcept {
    if (storage_ && pool_ != nullptr) {
        pool_->recycle(std::move(storage_));
    }
    storage_.reset();
    pool_ = nullptr;
    capacity_ = 0;
}

} // namespace rangestream
