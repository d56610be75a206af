#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <vector>
#include "../reader_base.hpp"

namespace rangestream {
namespace buffer_impl {

/// Body over bytes that stay alive for the duration of the read (zero-copy)
class BorrowedSpanBody {
private:
    std::span<const std::byte> data_;
    std::size_t position_{0};
    CancellationToken token_;
    bool closed_{false};

public:
    BorrowedSpanBody() noexcept = default;

    BorrowedSpanBody(std::span<const std::byte> data, CancellationToken token) noexcept
        : data_(data), token_(token) {}

    [[nodiscard]] Result<std::size_t> read_some(std::span<std::byte> buffer) noexcept {
        if (closed_) [[unlikely]] {
            return Err(Error::Code::InvalidOperation, "Read on closed body");
        }
        if (token_.is_cancelled()) [[unlikely]] {
            return token_.status().error();
        }

        std::size_t n = std::min(buffer.size(), data_.size() - position_);
        if (n > 0) {
            std::memcpy(buffer.data(), data_.data() + position_, n);
            position_ += n;
        }
        return Ok(n);
    }

    [[nodiscard]] Result<void> close() noexcept {
        closed_ = true;
        return Ok();
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - position_; }

    BorrowedSpanBody(BorrowedSpanBody&&) noexcept = default;
    BorrowedSpanBody& operator=(BorrowedSpanBody&&) noexcept = default;
    BorrowedSpanBody(const BorrowedSpanBody&) = delete;
    BorrowedSpanBody& operator=(const BorrowedSpanBody&) = delete;
};

static_assert(RangeBody<BorrowedSpanBody>, "BorrowedSpanBody must satisfy RangeBody concept");

/// Clamp a requested range to an object of the given size
/// @retval OutOfBounds offset lies past the end of the object
[[nodiscard]] inline Result<std::span<const std::byte>> slice(
    std::span<const std::byte> object, std::size_t offset, std::size_t length) noexcept {
    if (offset >= object.size() && !(offset == 0 && length == 0)) [[unlikely]] {
        return Err(Error::Code::OutOfBounds, "Range offset beyond object size");
    }
    std::size_t available = object.size() - std::min(offset, object.size());
    return Ok(object.subspan(std::min(offset, object.size()), std::min(length, available)));
}

} // namespace buffer_impl

/// In-memory object view source (borrowed, zero-copy)
/// Thread-safe as long as the viewed bytes are not modified during reads
class BufferViewSource {
protected:
    std::span<const std::byte> buffer_;

public:
    using BodyType = buffer_impl::BorrowedSpanBody;

    BufferViewSource() noexcept = default;

    explicit BufferViewSource(std::span<const std::byte> buffer) noexcept
        : buffer_(buffer) {}

    // Template constructor for any span type
    template <typename T>
    explicit BufferViewSource(std::span<const T> data) noexcept
        : buffer_(std::as_bytes(data)) {}

    [[nodiscard]] Result<BodyType> get(std::size_t offset, std::size_t length, CancellationToken token) const noexcept {
        return buffer_impl::slice(buffer_, offset, length).transform(
            [&token](std::span<const std::byte> range) { return BodyType(range, token); });
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        // An empty buffer is still valid - it just has zero size
        return true;
    }

    void set_buffer(std::span<const std::byte> buffer) noexcept {
        buffer_ = buffer;
    }

    [[nodiscard]] std::span<const std::byte> buffer() const noexcept {
        return buffer_;
    }
};

static_assert(RangeSource<BufferViewSource>, "BufferViewSource must satisfy RangeSource concept");

/// In-memory owned object source (backed by std::vector)
/// Bodies borrow from the vector: the source must outlive them
class BufferSource {
protected:
    std::vector<std::byte> buffer_;

public:
    using BodyType = buffer_impl::BorrowedSpanBody;

    BufferSource() noexcept = default;

    explicit BufferSource(std::vector<std::byte> data) noexcept
        : buffer_(std::move(data)) {}

    // Constructor from existing data (copy)
    explicit BufferSource(std::span<const std::byte> data)
        : buffer_(data.begin(), data.end()) {}

    template <typename T>
    explicit BufferSource(std::span<const T> data)
        : buffer_(std::as_bytes(data).begin(), std::as_bytes(data).end()) {}

    [[nodiscard]] Result<BodyType> get(std::size_t offset, std::size_t length, CancellationToken token) const noexcept {
        return buffer_impl::slice(buffer_, offset, length).transform(
            [&token](std::span<const std::byte> range) { return BodyType(range, token); });
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return true;  // Owned buffers are always valid (even if empty)
    }

    [[nodiscard]] std::span<const std::byte> buffer() const noexcept {
        return buffer_;
    }

    [[nodiscard]] const std::vector<std::byte>& data() const noexcept {
        return buffer_;
    }
};

static_assert(RangeSource<BufferSource>, "BufferSource must satisfy RangeSource concept");

} // namespace rangestream
