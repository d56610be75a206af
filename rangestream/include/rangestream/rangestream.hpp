#pragma once

/// Main header for the rangestream library
///
/// This library reads one object of known size as an ordered byte stream,
/// while fetching its parts concurrently through independent range requests.
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - Any object store plugs in through the RangeSource concept
/// - Strict in-order delivery with a bounded prefetch window
/// - Pooled part buffers and cooperative cancellation with a cause
///
/// Example usage:
/// ```cpp
/// #include <rangestream/rangestream.hpp>
///
/// using namespace rangestream;
///
/// PreadFileSource source("object.bin");
/// if (!source.is_valid()) {
///     // Handle error
/// }
///
/// ParallelReader<PreadFileSource>::Config config;
/// config.part_size = 4 * 1024 * 1024;
/// config.parallelism = 8;
///
/// auto reader = ParallelReader<PreadFileSource>::create(
///     source, source.size().value(), config);
/// if (reader) {
///     std::vector<std::byte> chunk(64 * 1024);
///     while (true) {
///         auto n = reader.value()->read(chunk);
///         if (!n) {
///             if (n.error().is_end_of_stream()) break;
///             // Handle error
///             break;
///         }
///         // Consume chunk[0, n)
///     }
///     (void)reader.value()->close();
/// }
/// ```

#include "types/result.hpp"
#include "cancellation.hpp"
#include "channel.hpp"
#include "buffer_pool.hpp"
#include "reader_base.hpp"
#include "stream_descriptor.hpp"
#include "parallel_reader.hpp"
#include "read_helpers.hpp"
#include "readers/reader_buffer.hpp"
#include "readers/reader_stream.hpp"
#if defined(__unix__) || defined(__APPLE__)
#include "readers/reader_unix_pread.hpp"
#endif
