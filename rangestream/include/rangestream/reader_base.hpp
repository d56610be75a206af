#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include "cancellation.hpp"
#include "types/result.hpp"

namespace rangestream {

/// Concept for the readable body of one ranged request
/// Only one thread at a time accesses a body
template <typename T>
concept RangeBody = requires(T body, std::span<std::byte> buffer) {
    // Copy up to buffer.size() bytes into buffer.
    // Returns the number of bytes written, 0 meaning the body has no more data.
    { body.read_some(buffer) } -> std::same_as<Result<std::size_t>>;

    // Release the underlying transfer. Must be safe to call more than once.
    { body.close() } -> std::same_as<Result<void>>;

    // Bodies travel inside Result<T> from the source to the worker
    requires std::move_constructible<T>;
    requires std::is_nothrow_move_constructible_v<T>;
};


/// Concept for a remote (or local) object served through byte-range requests
template <typename T>
concept RangeSource = requires(const T source, std::size_t offset, std::size_t length, CancellationToken token) {
    // Open a body delivering bytes [offset, offset + length) of the object.
    // Calls to get() must be threadsafe: several workers issue requests
    // concurrently and consume their bodies in parallel.
    // A body may deliver fewer than length bytes if the object is shorter.
    // The token is cancelled when the caller loses interest in the body.
    { source.get(offset, length, token) } -> std::same_as<Result<typename T::BodyType>>;
    requires RangeBody<typename T::BodyType>;

    // Size of the object, when the source knows it
    { source.size() } -> std::same_as<Result<std::size_t>>;

    // Check if the source is valid/open
    { source.is_valid() } -> std::same_as<bool>;
};


/// Concept for a pull-based sequential byte stream
/// read() copies the next bytes of the stream into the caller's buffer and
/// returns how many were copied. A clean end is reported as an error with
/// code EndOfStream, any other error is terminal.
template <typename T>
concept SequentialReader = requires(T reader, std::span<std::byte> buffer) {
    { reader.read(buffer) } -> std::same_as<Result<std::size_t>>;
    { reader.close() } -> std::same_as<Result<void>>;
};

} // namespace rangestream
