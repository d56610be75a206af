#pragma once

#include <cstddef>
#include <new>
#include <span>
#include <vector>
#include "reader_base.hpp"
#include "types/result.hpp"

namespace rangestream {

/// @brief Read a sequential stream until its end
/// @tparam Reader Stream type (must satisfy SequentialReader)
/// @param reader Stream to drain
/// @param chunk_size Size of each read() request (clamped to at least 1)
/// @param size_hint Expected number of bytes, used to reserve the output
/// @return Every byte of the stream, in order
/// @retval The first error other than EndOfStream reported by read()
/// @note Does not close the reader
template <typename Reader>
requires SequentialReader<Reader>
[[nodiscard]] Result<std::vector<std::byte>> read_all(
    Reader& reader,
    std::size_t chunk_size = 64 * 1024,
    std::size_t size_hint = 0) noexcept {
    if (chunk_size == 0) {
        chunk_size = 1;
    }

    std::vector<std::byte> out;
    try {
        out.reserve(size_hint);
        std::vector<std::byte> chunk(chunk_size);

        while (true) {
            auto n = reader.read(std::span<std::byte>(chunk));
            if (!n) {
                if (n.error().is_end_of_stream()) {
                    break;
                }
                return n.error();
            }
            out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n.value()));
        }
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to grow output buffer");
    }
    return Ok(std::move(out));
}

/// @brief Read into buffer until it is full or the stream ends
/// @return Number of bytes copied, less than buffer.size() only at end of stream
/// @retval The first error other than EndOfStream reported by read()
template <typename Reader>
requires SequentialReader<Reader>
[[nodiscard]] Result<std::size_t> read_full(Reader& reader, std::span<std::byte> buffer) noexcept {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto n = reader.read(buffer.subspan(filled));
        if (!n) {
            if (n.error().is_end_of_stream()) {
                break;
            }
            return n.error();
        }
        filled += n.value();
    }
    return Ok(filled);
}

} // namespace rangestream
