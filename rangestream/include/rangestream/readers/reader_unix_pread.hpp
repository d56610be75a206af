#pragma once

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "../reader_base.hpp"

namespace rangestream {
namespace pread_impl {

/// Largest slice read per read_some() call, so that cancellation is
/// observed between slices of a large part
inline constexpr std::size_t max_slice_size = 1024 * 1024;

/// Body reading a byte range with positioned reads (no shared file offset)
class PreadRangeBody {
private:
    int fd_{-1};
    std::size_t offset_{0};
    std::size_t remaining_{0};
    CancellationToken token_;

public:
    PreadRangeBody() noexcept = default;

    PreadRangeBody(int fd, std::size_t offset, std::size_t length, CancellationToken token) noexcept
        : fd_(fd), offset_(offset), remaining_(length), token_(token) {}

    [[nodiscard]] Result<std::size_t> read_some(std::span<std::byte> buffer) noexcept {
        if (fd_ < 0) [[unlikely]] {
            return Err(Error::Code::InvalidOperation, "Read on closed body");
        }
        if (token_.is_cancelled()) [[unlikely]] {
            return token_.status().error();
        }

        std::size_t bytes_to_read = std::min({buffer.size(), remaining_, max_slice_size});
        if (bytes_to_read == 0) {
            return Ok(std::size_t{0});
        }

        ssize_t bytes_read;
        do {
            bytes_read = ::pread(fd_, buffer.data(), bytes_to_read, static_cast<off_t>(offset_));
        } while (bytes_read < 0 && errno == EINTR);

        if (bytes_read < 0) {
            return Err(Error::Code::ReadError,
                       "pread failed: " + std::string(std::strerror(errno)));
        }

        offset_ += static_cast<std::size_t>(bytes_read);
        remaining_ -= static_cast<std::size_t>(bytes_read);
        return Ok(static_cast<std::size_t>(bytes_read));
    }

    // The descriptor belongs to the source, closing only detaches the body
    [[nodiscard]] Result<void> close() noexcept {
        fd_ = -1;
        return Ok();
    }

    PreadRangeBody(PreadRangeBody&& other) noexcept
        : fd_(other.fd_)
        , offset_(other.offset_)
        , remaining_(other.remaining_)
        , token_(other.token_) {
        other.fd_ = -1;
    }

    PreadRangeBody& operator=(PreadRangeBody&& other) noexcept {
        if (this != &other) {
            fd_ = other.fd_;
            offset_ = other.offset_;
            remaining_ = other.remaining_;
            token_ = other.token_;
            other.fd_ = -1;
        }
        return *this;
    }

    PreadRangeBody(const PreadRangeBody&) = delete;
    PreadRangeBody& operator=(const PreadRangeBody&) = delete;
};

static_assert(RangeBody<PreadRangeBody>, "PreadRangeBody must satisfy RangeBody concept");

} // namespace pread_impl

/// File source using pread (POSIX) - thread-safe without locks
/// Bodies borrow the descriptor: the source must outlive them
class PreadFileSource {
protected:
    int fd_{-1};
    std::size_t size_{0};
    std::string path_;

public:
    using BodyType = pread_impl::PreadRangeBody;

    PreadFileSource() noexcept = default;

    explicit PreadFileSource(std::string_view path) noexcept {
        auto result = open(path);
        if (!result.is_ok()) {
            std::cerr << "PreadFileSource: Failed to open file: "
                      << result.error().message << "\n";
        }
    }

    ~PreadFileSource() noexcept {
        close();
    }

    PreadFileSource(const PreadFileSource&) = delete;
    PreadFileSource& operator=(const PreadFileSource&) = delete;

    PreadFileSource(PreadFileSource&& other) noexcept
        : fd_(other.fd_)
        , size_(other.size_)
        , path_(std::move(other.path_)) {
        other.fd_ = -1;
        other.size_ = 0;
    }

    PreadFileSource& operator=(PreadFileSource&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            size_ = other.size_;
            path_ = std::move(other.path_);
            other.fd_ = -1;
            other.size_ = 0;
        }
        return *this;
    }

    [[nodiscard]] Result<void> open(std::string_view path) noexcept {
        close();

        path_ = path;
        fd_ = ::open(path_.c_str(), O_RDONLY);

        if (fd_ < 0) {
            return Err(Error::Code::FileNotFound,
                       "Failed to open file: " + std::string(path));
        }

        struct stat st;
        if (fstat(fd_, &st) != 0) {
            close();
            return Err(Error::Code::ReadError,
                       "Failed to get file size: " + std::string(path));
        }

        size_ = static_cast<std::size_t>(st.st_size);
        return Ok();
    }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
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
        return Ok(BodyType(fd_, offset, bytes_to_read, token));
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        if (!is_valid()) {
            return Err(Error::Code::ReadError, "File not open");
        }
        return Ok(size_);
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return fd_ >= 0;
    }

    [[nodiscard]] std::string_view path() const noexcept {
        return path_;
    }
};

static_assert(RangeSource<PreadFileSource>, "PreadFileSource must satisfy RangeSource concept");

} // namespace rangestream
