#pragma once

#include <algorithm>
#include <cstddef>
#include <thread>
#include "types/result.hpp"

namespace rangestream {

/// @brief Byte range covered by one part, inclusive at both ends
/// @note Matches the [first, last] form of an HTTP Range header
struct PartRange {
    std::size_t first;   ///< Offset of the first byte
    std::size_t last;    ///< Offset of the last byte (inclusive)

    /// @brief Number of bytes in the range
    [[nodiscard]] constexpr std::size_t length() const noexcept {
        return last - first + 1;
    }
};

/// @brief Immutable layout of an object split into fixed-size parts
///
/// total_parts = ceil(total_size / part_size). Every part is part_size long
/// except possibly the last, which holds the remaining bytes.
/// An empty object has zero parts.
class StreamDescriptor {
public:
    /// @brief Validate the inputs and build the layout
    /// @param total_size Declared object size in bytes
    /// @param part_size Size of one part in bytes
    /// @param parallelism Number of concurrent part fetches, 0 = auto-detect
    /// @retval InvalidArgument part_size is zero
    [[nodiscard]] static Result<StreamDescriptor> create(
        std::size_t total_size,
        std::size_t part_size,
        std::size_t parallelism = 0) noexcept {
        if (part_size == 0) [[unlikely]] {
            return Err(Error::Code::InvalidArgument, "Part size must be greater than zero");
        }

        if (parallelism == 0) {
            parallelism = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }

        // ceil without overflow for sizes close to SIZE_MAX
        std::size_t total_parts = total_size / part_size + (total_size % part_size != 0 ? 1 : 0);
        return Ok(StreamDescriptor(total_size, part_size, total_parts, parallelism));
    }

    [[nodiscard]] constexpr std::size_t total_size() const noexcept { return total_size_; }
    [[nodiscard]] constexpr std::size_t part_size() const noexcept { return part_size_; }
    [[nodiscard]] constexpr std::size_t total_parts() const noexcept { return total_parts_; }
    [[nodiscard]] constexpr std::size_t parallelism() const noexcept { return parallelism_; }

    /// @brief Offset of the first byte of a part, relative to the object start
    [[nodiscard]] constexpr std::size_t part_offset(std::size_t index) const noexcept {
        return index * part_size_;
    }

    /// @brief Number of bytes in a part (the last part may be shorter)
    /// @note Returns 0 for an index past the end
    [[nodiscard]] constexpr std::size_t part_length(std::size_t index) const noexcept {
        if (index >= total_parts_) {
            return 0;
        }
        std::size_t start = part_offset(index);
        return std::min(part_size_, total_size_ - start);
    }

    /// @brief Inclusive byte range of a part, shifted by base_offset
    /// @param index Part index, must be < total_parts()
    /// @param base_offset Position of the stream start within the object
    [[nodiscard]] constexpr PartRange part_range(std::size_t index, std::size_t base_offset = 0) const noexcept {
        std::size_t first = base_offset + part_offset(index);
        return PartRange{first, first + part_length(index) - 1};
    }

private:
    constexpr StreamDescriptor(std::size_t total_size,
                               std::size_t part_size,
                               std::size_t total_parts,
                               std::size_t parallelism) noexcept
        : total_size_(total_size)
        , part_size_(part_size)
        , total_parts_(total_parts)
        , parallelism_(parallelism) {}

    std::size_t total_size_;
    std::size_t part_size_;
    std::size_t total_parts_;
    std::size_t parallelism_;
};

} // namespace rangestream
