#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <vector>
#include "buffer_pool.hpp"
#include "cancellation.hpp"
#include "channel.hpp"
#include "reader_base.hpp"
#include "stream_descriptor.hpp"
#include "types/result.hpp"

namespace rangestream {

/// @brief One downloaded part, owning the pool buffer that holds its bytes
struct Part {
    std::size_t index{0};     ///< Part index in [0, total_parts)
    BufferHandle buffer;      ///< Pool buffer of capacity part_size
    std::size_t length{0};    ///< Number of valid bytes in buffer

    /// @brief The bytes of this part (the buffer truncated to length)
    [[nodiscard]] std::span<const std::byte> data() const noexcept {
        return buffer.span().first(length);
    }
};

/// @brief Lifecycle of a ParallelReader
enum class ReaderState {
    NotStarted,   ///< No thread launched yet
    Running,      ///< Scheduler and workers launched
    Failed,       ///< A terminal error was observed by read()
    Closed        ///< close() was called
};

/// @brief Sequential reader over an object fetched as parallel range requests
///
/// The object is split into fixed-size parts. A pool of worker threads
/// fetches parts concurrently through RangeSource::get(), while read() hands
/// the bytes out strictly in object order.
///
/// Pipeline:
/// - Scheduler thread: pushes part indices 0..N-1 into a bounded request queue
/// - Worker threads: each claims the next index together with the next
///   response slot, fetches the part into a pool buffer and publishes it
/// - Collector thread: joins the workers, then closes every slot that can no
///   longer be served
/// - Consumer (read()): keeps up to parallelism * queue_depth one-shot slots
///   outstanding and always awaits the oldest one
///
/// Failure semantics:
/// - The first error (part fetch, short read, timeout, close) becomes the
///   sticky cancellation cause. Every later read() returns it.
/// - No part is retried
///
/// @tparam Source Range source type (must satisfy RangeSource)
/// @note read() and start() are meant for a single consumer thread.
///       close() may be called from any thread, including while read() blocks.
/// @note The source must outlive the reader
template <typename Source>
requires RangeSource<Source>
class ParallelReader {
public:
    struct Config {
        std::size_t part_size = 8 * 1024 * 1024;    ///< Bytes per range request
        std::size_t parallelism = 0;                 ///< Worker threads, 0 = auto-detect
        std::size_t queue_depth = 2;                 ///< Prefetched parts per worker
        std::size_t start_offset = 0;                ///< Position of the stream start in the object
        std::chrono::milliseconds timeout{0};        ///< Whole-stream deadline, 0 = none
        CancellationSource* parent = nullptr;        ///< Cancelling it cancels the reader
    };

    /// @brief Build a reader for the first total_size bytes at config.start_offset
    /// @param source Range source serving the object (must outlive the reader)
    /// @param total_size Declared number of bytes to stream
    /// @param config Reader configuration
    /// @return The reader, not started yet
    /// @retval InvalidArgument part_size or queue_depth is zero
    /// @retval InvalidArgument start_offset + total_size overflows
    /// @retval InvalidArgument parallelism * queue_depth overflows
    [[nodiscard]] static Result<std::unique_ptr<ParallelReader>> create(
        const Source& source,
        std::size_t total_size,
        Config config = {}) noexcept;

    ~ParallelReader();

    ParallelReader(const ParallelReader&) = delete;
    ParallelReader& operator=(const ParallelReader&) = delete;
    ParallelReader(ParallelReader&&) = delete;
    ParallelReader& operator=(ParallelReader&&) = delete;

    /// @brief Launch the scheduler, workers and collector
    /// @note Idempotent. Called implicitly by the first read().
    /// @note An empty object starts no thread
    /// @retval The cancellation cause if the reader is cancelled or closed
    [[nodiscard]] Result<void> start() noexcept;

    /// @brief Copy the next bytes of the stream into buffer
    /// @return Number of bytes copied (at most one part per call)
    /// @retval EndOfStream Every byte of the stream has been returned
    /// @retval StreamEndedEarly The pipeline finished without producing every byte
    /// @retval ShortRead A part body ended before its range was filled
    /// @retval Timeout The configured deadline passed
    /// @retval Cancelled The reader was closed or the parent was cancelled
    /// @note Any error other than EndOfStream is terminal and sticky
    [[nodiscard]] Result<std::size_t> read(std::span<std::byte> buffer) noexcept;

    /// @brief Stop every thread and return every buffer to the pool
    /// @note Idempotent and safe to call while another thread is in read()
    [[nodiscard]] Result<void> close() noexcept;

    [[nodiscard]] const StreamDescriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /// @brief Number of bytes returned by read() so far
    [[nodiscard]] std::size_t offset() const noexcept {
        return read_offset_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] ReaderState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /// @brief Number of worker threads launched (0 until started)
    [[nodiscard]] std::size_t workers_started() const noexcept {
        return workers_started_.load(std::memory_order_relaxed);
    }

    /// @brief Pool holding the part buffers, for statistics
    [[nodiscard]] const BufferPool& pool() const noexcept { return pool_; }

    /// @brief The cancellation cause, if any
    [[nodiscard]] std::optional<Error> cause() const { return cancel_.cause(); }

private:
    // One-shot channel carrying the result of exactly one part
    using Slot = Channel<Result<Part>>;
    using SlotPtr = std::shared_ptr<Slot>;

    ParallelReader(const Source& source, const StreamDescriptor& descriptor, const Config& config);

    [[nodiscard]] Result<void> start_locked() noexcept;

    // Thread bodies
    void schedule_requests() noexcept;
    void worker_loop() noexcept;
    void collect_workers() noexcept;

    /// Fetch one part into a pool buffer (worker side)
    [[nodiscard]] Result<Part> fetch_part(std::size_t index) noexcept;

    // Consumer side helpers (consumer_mutex_ held)
    [[nodiscard]] Result<void> submit_slots() noexcept;
    [[nodiscard]] Result<std::size_t> copy_out(std::span<std::byte> buffer) noexcept;
    [[nodiscard]] Error fail(Error error) noexcept;
    void check_deadline() noexcept;
    void join_threads() noexcept;
    void release_buffers() noexcept;

    const Source& source_;
    const StreamDescriptor descriptor_;
    const Config config_;
    const std::size_t window_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;

    // Declared before every channel and buffer so that it outlives them
    CancellationSource cancel_;
    std::size_t parent_subscription_{0};
    BufferPool pool_;

    Channel<std::size_t> requests_;
    Channel<SlotPtr> slots_;
    std::mutex dispatch_mutex_;  // Pairs the n-th index with the n-th slot

    std::thread scheduler_;
    std::thread collector_;
    std::vector<std::thread> workers_;
    std::atomic<std::size_t> workers_started_{0};

    std::atomic<ReaderState> state_{ReaderState::NotStarted};
    std::atomic<bool> closed_{false};

    // Cursor state, owned by the consumer
    std::mutex consumer_mutex_;
    bool started_{false};
    std::deque<SlotPtr> pending_;
    std::size_t slots_submitted_{0};
    std::size_t parts_delivered_{0};
    std::optional<Part> current_;
    std::size_t consumed_{0};
    std::atomic<std::size_t> read_offset_{0};
};

} // namespace rangestream

#define RANGESTREAM_PARALLEL_READER_HEADER
#include "impl/parallel_reader_impl.hpp"
