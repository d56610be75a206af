#pragma once

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include "../reader_base.hpp"

namespace rangestream {
namespace stream_impl {

/// Largest slice copied per read_some() call, so that cancellation is
/// observed between slices of a large part
inline constexpr std::size_t max_slice_size = 1024 * 1024;

/// Body reading a byte range from a shared std::fstream
/// Each slice is a seek+read under the source mutex
class StreamRangeBody {
private:
    std::fstream* stream_{nullptr};
    std::mutex* mutex_{nullptr};
    std::size_t offset_{0};
    std::size_t remaining_{0};
    CancellationToken token_;

public:
    StreamRangeBody() noexcept = default;

    StreamRangeBody(std::fstream* stream, std::mutex* mutex,
                    std::size_t offset, std::size_t length, CancellationToken token) noexcept
        : stream_(stream), mutex_(mutex), offset_(offset), remaining_(length), token_(token) {}

    [[nodiscard]] Result<std::size_t> read_some(std::span<std::byte> buffer) noexcept {
        if (stream_ == nullptr) [[unlikely]] {
            return Err(Error::Code::InvalidOperation, "Read on closed body");
        }
        if (token_.is_cancelled()) [[unlikely]] {
            return token_.status().error();
        }

        std::size_t bytes_to_read = std::min({buffer.size(), remaining_, max_slice_size});
        if (bytes_to_read == 0) {
            return Ok(std::size_t{0});
        }

        // Lock for seek+read operations
        std::lock_guard<std::mutex> lock(*mutex_);

        stream_->clear();
        stream_->seekg(static_cast<std::streamoff>(offset_), std::ios::beg);
        if (!*stream_) {
            return Err(Error::Code::ReadError, "Failed to seek to offset");
        }

        stream_->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(bytes_to_read));
        if (!*stream_ && !stream_->eof()) {
            return Err(Error::Code::ReadError, "Failed to read from file");
        }

        std::size_t actual_read = static_cast<std::size_t>(stream_->gcount());
        offset_ += actual_read;
        remaining_ -= actual_read;
        return Ok(actual_read);
    }

    [[nodiscard]] Result<void> close() noexcept {
        stream_ = nullptr;
        mutex_ = nullptr;
        return Ok();
    }

    StreamRangeBody(StreamRangeBody&& other) noexcept
        : stream_(other.stream_)
        , mutex_(other.mutex_)
        , offset_(other.offset_)
        , remaining_(other.remaining_)
        , token_(other.token_) {
        other.stream_ = nullptr;
        other.mutex_ = nullptr;
    }

    StreamRangeBody& operator=(StreamRangeBody&& other) noexcept {
        if (this != &other) {
            stream_ = other.stream_;
            mutex_ = other.mutex_;
            offset_ = other.offset_;
            remaining_ = other.remaining_;
            token_ = other.token_;
            other.stream_ = nullptr;
            other.mutex_ = nullptr;
        }
        return *this;
    }

    StreamRangeBody(const StreamRangeBody&) = delete;
    StreamRangeBody& operator=(const StreamRangeBody&) = delete;
};

static_assert(RangeBody<StreamRangeBody>, "StreamRangeBody must satisfy RangeBody concept");

} // namespace stream_impl

/// Portable file source using std::fstream - thread-safe with mutex
/// Bodies borrow the stream: the source must outlive them
class StreamFileSource {
protected:
    mutable std::fstream stream_;
    mutable std::mutex mutex_;
    std::size_t size_{0};
    std::string path_;

public:
    using BodyType = stream_impl::StreamRangeBody;

    StreamFileSource() noexcept = default;

    explicit StreamFileSource(std::string_view path) noexcept {
        auto result = open(path);
        if (!result.is_ok()) {
            std::cerr << "StreamFileSource: Failed to open file: "
                      << result.error().message << "\n";
        }
    }

    ~StreamFileSource() noexcept {
        close();
    }

    StreamFileSource(const StreamFileSource&) = delete;
    StreamFileSource& operator=(const StreamFileSource&) = delete;

    [[nodiscard]] Result<void> open(std::string_view path) noexcept {
        close();

        path_ = path;
        stream_.open(path_, std::ios::binary | std::ios::in);
        if (!stream_) {
            return Err(Error::Code::FileNotFound, "Failed to open file: " + std::string(path));
        }

        // Get file size
        stream_.seekg(0, std::ios::end);
        size_ = static_cast<std::size_t>(stream_.tellg());
        stream_.seekg(0, std::ios::beg);

        return Ok();
    }

    void close() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_.is_open()) {
            stream_.close();
            size_ = 0;
        }
    }

    /// Open a body over [offset, offset + length), clamped to the file size
    [[nodiscard]] Result<BodyType> get(std::size_t offset, std::size_t length, CancellationToken token) const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "File not open");
        }

        if (offset >= size_) {
            return Err(Error::Code::OutOfBounds, "Range offset beyond file size");
        }

        std::size_t bytes_to_read = std::min(length, size_ - offset);
        return Ok(BodyType(&stream_, &mutex_, offset, bytes_to_read, token));
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "File not open");
        }
        return Ok(size_);
    }

    [[nodiscard]] bool is_valid() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_.is_open();
    }

    [[nodiscard]] std::string_view path() const noexcept {
        return path_;
    }
};

static_assert(RangeSource<StreamFileSource>, "StreamFileSource must satisfy RangeSource concept");

} // namespace rangestream
