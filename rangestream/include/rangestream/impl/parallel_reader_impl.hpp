#pragma once

#include <algorithm>
#include <chrono>
#include <cstring>
#include <limits>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <system_error>
#include <thread>
#include "../buffer_pool.hpp"
#include "../cancellation.hpp"
#include "../channel.hpp"
#include "../reader_base.hpp"
#include "../stream_descriptor.hpp"
#include "../types/result.hpp"

#ifndef RANGESTREAM_PARALLEL_READER_HEADER
#include "../parallel_reader.hpp"
#endif

namespace rangestream {

// ============================================================================
// ParallelReader Implementation
// ============================================================================
//
// Design Overview:
// ----------------
// The object is fetched as independent range requests, one per part, by a
// fixed pool of workers. Parts complete in any order but must be handed to
// the consumer in object order. Instead of buffering out-of-order parts in a
// reorder map, the consumer pre-allocates one single-use response slot per
// part it wants, in order, and the workers fill them.
//
// Ordering:
// ---------
// - The scheduler pushes indices 0..N-1 in increasing order
// - The consumer pushes slots in the order it will await them
// - A worker pops one index and one slot under dispatch_mutex_, so the n-th
//   index is always paired with the n-th slot
// - The consumer awaits its slots oldest first
//
// Memory:
// -------
// At most window_ = parallelism * queue_depth slots are outstanding, so at
// most window_ part buffers (plus the one being consumed) are alive. Buffers
// come from pool_ and return to it when the consumer has copied them out, or
// when a part is dropped after an error.
//
// Shutdown:
// ---------
// - cancel_ is the single stop signal. Every channel observes it, and range
//   bodies observe it through the token given to get().
// - The collector joins the workers, then closes slots_ and every slot still
//   queued in it, so an awaited slot that no worker will serve reports closure
//   instead of blocking forever
// - close() cancels first, then takes consumer_mutex_, so a read() blocked
//   on a slot wakes up and releases the mutex
//
// Invariants:
// -----------
// - slots_submitted_ <= total_parts
// - pending_.size() <= window_
// - parts_delivered_ + pending_.size() == slots_submitted_
// - Every worker exits once requests_ is closed and drained, or on cancel
//
// ============================================================================

template <typename Source>
requires RangeSource<Source>
Result<std::unique_ptr<ParallelReader<Source>>> ParallelReader<Source>::create(
    const Source& source,
    std::size_t total_size,
    Config config) noexcept {
    if (config.queue_depth == 0) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Queue depth must be greater than zero");
    }
    if (config.start_offset > std::numeric_limits<std::size_t>::max() - total_size) [[unlikely]] {
        return Err(Error::Code::InvalidArgument, "Start offset plus size overflows");
    }

    return StreamDescriptor::create(total_size, config.part_size, config.parallelism).and_then(
        [&](const StreamDescriptor& descriptor) -> Result<std::unique_ptr<ParallelReader>> {
            // The prefetch window sizes the channels and bounds pending slots
            if (descriptor.parallelism() > std::numeric_limits<std::size_t>::max() / config.queue_depth) [[unlikely]] {
                return Err(Error::Code::InvalidArgument, "Parallelism times queue depth overflows");
            }
            config.parallelism = descriptor.parallelism();

            try {
                return Ok(std::unique_ptr<ParallelReader>(
                    new ParallelReader(source, descriptor, config)));
            } catch (const std::bad_alloc&) {
                return Err(Error::Code::MemoryError, "Failed to allocate parallel reader");
            }
        });
}

template <typename Source>
requires RangeSource<Source>
ParallelReader<Source>::ParallelReader(
    const Source& source,
    const StreamDescriptor& descriptor,
    const Config& config)
    : source_(source)
    , descriptor_(descriptor)
    , config_(config)
    , window_(descriptor.parallelism() * config.queue_depth)
    , pool_(descriptor.part_size())
    , requests_(window_, &cancel_)
    , slots_(window_, &cancel_) {
    if (config_.timeout.count() > 0) {
        deadline_ = std::chrono::steady_clock::now() + config_.timeout;
    }

    if (config_.parent != nullptr) {
        // Context derivation: the parent's cause becomes ours.
        // Runs immediately if the parent is already cancelled.
        CancellationSource* parent = config_.parent;
        parent_subscription_ = parent->subscribe([this, parent] {
            cancel_.cancel(parent->cause().value_or(
                Err(Error::Code::Cancelled, "Parent cancelled")));
        });
    }
}

template <typename Source>
requires RangeSource<Source>
ParallelReader<Source>::~ParallelReader() {
    if (config_.parent != nullptr) {
        config_.parent->unsubscribe(parent_subscription_);
    }
    (void)close();
}

template <typename Source>
requires RangeSource<Source>
Result<void> ParallelReader<Source>::start() noexcept {
    std::lock_guard lock(consumer_mutex_);
    return start_locked();
}

template <typename Source>
requires RangeSource<Source>
Result<void> ParallelReader<Source>::start_locked() noexcept {
    if (auto status = cancel_.status(); !status) {
        return status;
    }
    if (started_) {
        return Ok();
    }
    started_ = true;

    // Nothing to fetch
    if (descriptor_.total_parts() == 0) {
        state_.store(ReaderState::Running, std::memory_order_release);
        return Ok();
    }

    try {
        workers_.reserve(descriptor_.parallelism());
        for (std::size_t i = 0; i < descriptor_.parallelism(); ++i) {
            workers_.emplace_back(&ParallelReader::worker_loop, this);
            workers_started_.fetch_add(1, std::memory_order_relaxed);
        }

        // The collector is the only one to join the workers from now on
        collector_ = std::thread(&ParallelReader::collect_workers, this);
        scheduler_ = std::thread(&ParallelReader::schedule_requests, this);
    } catch (const std::system_error& e) {
        cancel_.cancel(Err(Error::Code::Unknown,
                           std::string("Failed to launch reader threads: ") + e.what()));
        join_threads();
        state_.store(ReaderState::Failed, std::memory_order_release);
        return *cancel_.cause();
    } catch (const std::bad_alloc&) {
        cancel_.cancel(Err(Error::Code::MemoryError, "Failed to launch reader threads"));
        join_threads();
        state_.store(ReaderState::Failed, std::memory_order_release);
        return *cancel_.cause();
    }

    state_.store(ReaderState::Running, std::memory_order_release);
    return Ok();
}

template <typename Source>
requires RangeSource<Source>
void ParallelReader<Source>::schedule_requests() noexcept {
    for (std::size_t index = 0; index < descriptor_.total_parts(); ++index) {
        std::size_t next = index;
        if (requests_.push(std::move(next)).is_error()) {
            break;  // cancelled
        }
    }
    requests_.close();
}

template <typename Source>
requires RangeSource<Source>
void ParallelReader<Source>::worker_loop() noexcept {
    while (true) {
        std::size_t index;
        SlotPtr slot;
        {
            std::lock_guard lock(dispatch_mutex_);

            auto request = requests_.pop();
            if (!request || !request.value()) {
                return;  // cancelled, or every index has been claimed
            }
            index = *request.value();

            // The consumer submits the slot for this index before it needs the part
            auto next_slot = slots_.pop();
            if (!next_slot || !next_slot.value()) {
                return;
            }
            slot = std::move(*next_slot.value());
        }

        auto result = fetch_part(index);

        // Only fails once cancelled, the part buffer then returns to the pool
        if (slot->push(std::move(result)).is_error()) {
            return;
        }
    }
}

template <typename Source>
requires RangeSource<Source>
void ParallelReader<Source>::collect_workers() noexcept {
    for (auto& worker : workers_) {
        worker.join();
    }

    // From here on no slot can be served
    slots_.close();
    for (auto& slot : slots_.drain()) {
        slot->close();
    }
}

template <typename Source>
requires RangeSource<Source>
Result<Part> ParallelReader<Source>::fetch_part(std::size_t index) noexcept {
    const PartRange range = descriptor_.part_range(index, config_.start_offset);
    const std::size_t length = range.length();

    auto body_result = source_.get(range.first, length, CancellationToken(cancel_));
    if (!body_result) {
        return body_result.error();
    }
    auto body = std::move(body_result.value());

    BufferHandle buffer;
    try {
        buffer = pool_.acquire();
    } catch (const std::bad_alloc&) {
        (void)body.close();
        return Err(Error::Code::MemoryError,
                   "Failed to allocate buffer for part " + std::to_string(index));
    }

    // Fill exactly length bytes, or stop when the body runs dry
    auto destination = buffer.span().first(length);
    std::size_t filled = 0;
    while (filled < length) {
        auto n = body.read_some(destination.subspan(filled));
        if (!n) {
            (void)body.close();
            return n.error();
        }
        if (n.value() == 0) {
            break;
        }
        filled += n.value();
    }

    auto close_result = body.close();

    if (filled < length) {
        return Err(Error::Code::ShortRead,
                   "Part " + std::to_string(index) + ": expected " + std::to_string(length) +
                   " bytes, got " + std::to_string(filled));
    }
    if (!close_result) {
        return close_result.error();
    }

    return Ok(Part{index, std::move(buffer), length});
}

template <typename Source>
requires RangeSource<Source>
Result<std::size_t> ParallelReader<Source>::read(std::span<std::byte> buffer) noexcept {
    std::lock_guard lock(consumer_mutex_);

    check_deadline();
    if (auto status = cancel_.status(); !status) {
        return status.error();
    }

    if (buffer.empty()) {
        return Ok(std::size_t{0});
    }

    // Unconsumed data from the current part
    if (current_) {
        return copy_out(buffer);
    }

    if (parts_delivered_ == descriptor_.total_parts()) {
        if (read_offset_.load(std::memory_order_relaxed) == descriptor_.total_size()) {
            return Err(Error::Code::EndOfStream, "End of stream");
        }
        // fetch_part delivers exactly length() bytes per part, so this is a guard only
        return fail(Err(Error::Code::StreamEndedEarly, "Unexpected end of download stream"));
    }

    if (auto started = start_locked(); !started) {
        return started.error();
    }

    if (auto submitted = submit_slots(); !submitted) {
        return fail(submitted.error());
    }

    SlotPtr slot = std::move(pending_.front());
    pending_.pop_front();

    auto received = deadline_ ? slot->pop_until(*deadline_) : slot->pop();
    if (!received) {
        return fail(received.error());
    }
    if (!received.value()) {
        // Slots are closed unserved only once all workers have exited without a cancellation cause
        return fail(Err(Error::Code::StreamEndedEarly,
                        "Part " + std::to_string(parts_delivered_) + " was never delivered"));
    }

    Result<Part> part = std::move(*received.value());
    if (!part) {
        return fail(part.error());
    }

    current_.emplace(std::move(part.value()));
    consumed_ = 0;
    ++parts_delivered_;

    return copy_out(buffer);
}

template <typename Source>
requires RangeSource<Source>
Result<void> ParallelReader<Source>::submit_slots() noexcept {
    while (slots_submitted_ < descriptor_.total_parts() && pending_.size() < window_) {
        SlotPtr slot;
        try {
            slot = std::make_shared<Slot>(1, &cancel_);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate response slot");
        }

        // Never blocks: slots_ has room for a whole window
        auto pushed = slots_.push(SlotPtr(slot));
        if (!pushed) {
            if (pushed.error().code == Error::Code::ChannelClosed) {
                // Workers only run out of indices after every slot was submitted
                return Err(Error::Code::StreamEndedEarly,
                           "Workers exited before part " + std::to_string(slots_submitted_) +
                           " was requested");
            }
            return pushed.error();
        }

        pending_.push_back(std::move(slot));
        ++slots_submitted_;
    }
    return Ok();
}

template <typename Source>
requires RangeSource<Source>
Result<std::size_t> ParallelReader<Source>::copy_out(std::span<std::byte> buffer) noexcept {
    auto data = current_->data().subspan(consumed_);
    std::size_t n = std::min(buffer.size(), data.size());
    std::memcpy(buffer.data(), data.data(), n);

    consumed_ += n;
    read_offset_.fetch_add(n, std::memory_order_relaxed);

    if (consumed_ == current_->length) {
        auto released = pool_.release(std::move(current_->buffer));
        current_.reset();
        consumed_ = 0;
        if (!released) {
            return fail(released.error());
        }
    }
    return Ok(n);
}

template <typename Source>
requires RangeSource<Source>
Error ParallelReader<Source>::fail(Error error) noexcept {
    // First writer wins: an earlier cause takes precedence
    cancel_.cancel(std::move(error));

    current_.reset();
    consumed_ = 0;

    ReaderState expected = ReaderState::Running;
    state_.compare_exchange_strong(expected, ReaderState::Failed, std::memory_order_acq_rel);
    expected = ReaderState::NotStarted;
    state_.compare_exchange_strong(expected, ReaderState::Failed, std::memory_order_acq_rel);

    return *cancel_.cause();
}

template <typename Source>
requires RangeSource<Source>
void ParallelReader<Source>::check_deadline() noexcept {
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
        cancel_.cancel(Err(Error::Code::Timeout, "Parallel read deadline exceeded"));
    }
}

template <typename Source>
requires RangeSource<Source>
Result<void> ParallelReader<Source>::close() noexcept {
    // Cancel before taking the consumer lock: a read() blocked on a slot
    // wakes up with the cause and releases the lock
    cancel_.cancel(Err(Error::Code::Cancelled, "Reader closed"));

    std::lock_guard lock(consumer_mutex_);
    if (closed_.exchange(true)) {
        return Ok();
    }

    join_threads();
    release_buffers();
    state_.store(ReaderState::Closed, std::memory_order_release);
    return Ok();
}

template <typename Source>
requires RangeSource<Source>
void ParallelReader<Source>::join_threads() noexcept {
    if (scheduler_.joinable()) {
        scheduler_.join();
    }
    if (collector_.joinable()) {
        collector_.join();
    } else {
        // Launch failed before the collector took over the workers
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
}

template <typename Source>
requires RangeSource<Source>
void ParallelReader<Source>::release_buffers() noexcept {
    current_.reset();
    consumed_ = 0;

    // Parts published but never awaited
    for (auto& slot : pending_) {
        (void)slot->drain();
    }
    pending_.clear();

    (void)slots_.drain();
    (void)requests_.drain();
}

} // namespace rangestream
