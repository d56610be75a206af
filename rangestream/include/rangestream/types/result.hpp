#pragma once

#include <concepts>
#include <string>
#include <utility>
#include <variant>

namespace rangestream {

/// Error type for range stream operations
struct Error {
    enum class Code {
        Success,
        FileNotFound,
        ReadError,
        NetworkError,
        OutOfBounds,
        InvalidArgument,
        InvalidOperation,
        MemoryError,
        ShortRead,          // A part body ended before its range length was filled
        StreamEndedEarly,   // Part accounting does not add up to the declared size
        EndOfStream,        // Clean end of a sequential stream
        ChannelClosed,
        Cancelled,
        Timeout,
        Unknown
    };

    Code code;
    std::string message;

    constexpr Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] constexpr bool is_success() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return code != Code::Success;
    }

    [[nodiscard]] constexpr bool is_end_of_stream() const noexcept {
        return code == Code::EndOfStream;
    }
};

/// Result type for operations that may fail without exceptions
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    // Constructors
    constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::in_place_type<T>, std::forward<T>(value)) {}

    constexpr Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(std::in_place_type<T>, value) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::in_place_type<Error>, std::forward<Error>(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(std::in_place_type<Error>, error) {}

    // Status checks
    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_ok();
    }

    // Value access
    [[nodiscard]] constexpr T& value() & noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] constexpr const T& value() const& noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] constexpr T&& value() && noexcept {
        return std::get<T>(std::move(data_));
    }

    // Error access
    [[nodiscard]] constexpr const Error& error() const noexcept {
        return std::get<Error>(data_);
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) const& {
        if (is_ok()) {
            return value();
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) && {
        if (is_ok()) {
            return std::move(value());
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    // Monadic operations
    template <typename F>
    [[nodiscard]] constexpr auto and_then(F&& func) & -> decltype(func(std::declval<T&>())) {
        if (is_ok()) {
            return func(value());
        }
        using RetType = decltype(func(std::declval<T&>()));
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] constexpr auto and_then(F&& func) && -> decltype(func(std::declval<T&&>())) {
        if (is_ok()) {
            return func(std::move(value()));
        }
        using RetType = decltype(func(std::declval<T&&>()));
        return RetType{error()};
    }

    template <typename F>
    [[nodiscard]] constexpr auto transform(F&& func) const& {
        using U = decltype(func(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>{func(value())};
        }
        return Result<U>{error()};
    }

    template <typename F>
    [[nodiscard]] constexpr auto transform(F&& func) && {
        using U = decltype(func(std::declval<T&&>()));
        if (is_ok()) {
            return Result<U>{func(std::move(value()))};
        }
        return Result<U>{error()};
    }
};

// Specialization for void
template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    constexpr Result() noexcept : data_(std::monostate{}) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<std::monostate>(data_);
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] constexpr const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

// Helper functions for creating results
template <typename T>
[[nodiscard]] constexpr Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] constexpr Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

/// Human readable name of an error code, used when composing messages
[[nodiscard]] constexpr const char* to_string(Error::Code code) noexcept {
    switch (code) {
        case Error::Code::Success: return "Success";
        case Error::Code::FileNotFound: return "FileNotFound";
        case Error::Code::ReadError: return "ReadError";
        case Error::Code::NetworkError: return "NetworkError";
        case Error::Code::OutOfBounds: return "OutOfBounds";
        case Error::Code::InvalidArgument: return "InvalidArgument";
        case Error::Code::InvalidOperation: return "InvalidOperation";
        case Error::Code::MemoryError: return "MemoryError";
        case Error::Code::ShortRead: return "ShortRead";
        case Error::Code::StreamEndedEarly: return "StreamEndedEarly";
        case Error::Code::EndOfStream: return "EndOfStream";
        case Error::Code::ChannelClosed: return "ChannelClosed";
        case Error::Code::Cancelled: return "Cancelled";
        case Error::Code::Timeout: return "Timeout";
        case Error::Code::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace rangestream
