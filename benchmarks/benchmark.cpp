#include <benchmark/benchmark.h>
#include <chrono>
#include <memory>
#include <vector>

#include "benchmark_helpers.hpp"

#include "../rangestream/include/rangestream/parallel_reader.hpp"
#include "../rangestream/include/rangestream/readers/reader_buffer.hpp"

/// StreamFileSource from reader_stream serializes its gets, pread does not.
#if defined(__linux__) || defined(__unix__) || defined(__APPLE__)
    #include "../rangestream/include/rangestream/readers/reader_unix_pread.hpp"
    using FileSource = rangestream::PreadFileSource;
#else
    #include "../rangestream/include/rangestream/readers/reader_stream.hpp"
    // Fallback to portable stream source
    using FileSource = rangestream::StreamFileSource;
#endif

using namespace rangestream;
using namespace rangestream_bench;

constexpr std::size_t KiB = 1024;
constexpr std::size_t MiB = 1024 * KiB;

// Drain one reader per iteration into a preallocated buffer
template <typename Source>
static void run_parallel_read(benchmark::State& state, const Source& source, const ObjectConfig& config) {
    std::vector<std::byte> chunk(256 * KiB);
    std::size_t bytes_processed = 0;

    typename ParallelReader<Source>::Config reader_config;
    reader_config.part_size = config.part_size;
    reader_config.parallelism = config.parallelism;
    reader_config.queue_depth = config.queue_depth;

    for (auto _ : state) {
        auto reader = ParallelReader<Source>::create(source, config.size, reader_config);
        if (!reader) {
            state.SkipWithError(("Failed to create reader: " + reader.error().message).c_str());
            return;
        }

        std::size_t total = 0;
        while (true) {
            auto n = reader.value()->read(std::span<std::byte>(chunk));
            if (!n) {
                if (n.error().is_end_of_stream()) {
                    break;
                }
                state.SkipWithError(("Read failed: " + n.error().message).c_str());
                return;
            }
            total += n.value();
            benchmark::DoNotOptimize(chunk.data());
        }

        if (total != config.size) {
            state.SkipWithError("Incomplete read");
            return;
        }
        bytes_processed += total;
    }

    state.SetLabel(config.name());
    state.SetBytesProcessed(bytes_processed);
    state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// In-Memory Source - Part Size and Parallelism Variations
// ============================================================================

static void BM_Read_Buffer(benchmark::State& state) {
    // Parameters: size MiB, part size KiB, parallelism
    ObjectConfig config{
        static_cast<std::size_t>(state.range(0)) * MiB,
        static_cast<std::size_t>(state.range(1)) * KiB,
        static_cast<std::size_t>(state.range(2))};

    ContentGenerator gen;
    auto data = gen.generate(config.size, ContentPattern::Random);
    BufferViewSource source{std::span<const std::byte>(data)};

    run_parallel_read(state, source, config);
}

// ============================================================================
// File Source
// ============================================================================

static void BM_Read_File(benchmark::State& state) {
    // Parameters: size MiB, part size KiB, parallelism
    ObjectConfig config{
        static_cast<std::size_t>(state.range(0)) * MiB,
        static_cast<std::size_t>(state.range(1)) * KiB,
        static_cast<std::size_t>(state.range(2))};

    TempFileManager temp_mgr;
    ContentGenerator gen;
    auto data = gen.generate(config.size, ContentPattern::Random);
    auto filepath = temp_mgr.create_file("read_file_" + config.name(), data);

    FileSource source(filepath.string());
    if (!source.is_valid()) {
        state.SkipWithError("Failed to open benchmark file");
        return;
    }

    run_parallel_read(state, source, config);
}

// ============================================================================
// High Latency Source
// ============================================================================

static void BM_Read_HighLatency(benchmark::State& state) {
    // Parameters: latency us, parallelism, queue depth
    ObjectConfig config{16 * MiB, 512 * KiB,
                        static_cast<std::size_t>(state.range(1)),
                        static_cast<std::size_t>(state.range(2))};

    ContentGenerator gen;
    auto data = gen.generate(config.size, ContentPattern::Sequential);
    LatencySource source(std::span<const std::byte>(data), std::chrono::microseconds(state.range(0)));

    run_parallel_read(state, source, config);
}

// ============================================================================
// Baseline: one range request for the whole object
// ============================================================================

static void BM_Baseline_SingleGet(benchmark::State& state) {
    std::size_t size = static_cast<std::size_t>(state.range(0)) * MiB;

    ContentGenerator gen;
    auto data = gen.generate(size, ContentPattern::Random);
    BufferViewSource source{std::span<const std::byte>(data)};
    std::vector<std::byte> output(size);
    std::size_t bytes_processed = 0;

    for (auto _ : state) {
        auto body = source.get(0, size, CancellationToken{});
        if (!body) {
            state.SkipWithError(body.error().message.c_str());
            return;
        }
        std::size_t filled = 0;
        while (filled < size) {
            auto n = body.value().read_some(std::span<std::byte>(output).subspan(filled));
            if (!n || n.value() == 0) {
                break;
            }
            filled += n.value();
        }
        (void)body.value().close();
        benchmark::DoNotOptimize(output.data());
        bytes_processed += filled;
    }

    state.SetBytesProcessed(bytes_processed);
}

// ============================================================================
// Benchmark Registration
// ============================================================================

BENCHMARK(BM_Baseline_SingleGet)
    ->Arg(64)
    ->Name("RangeStream/Baseline/SingleGet")
    ->Unit(benchmark::kMillisecond);

// Params: size MiB, part size KiB, parallelism
BENCHMARK(BM_Read_Buffer)
    ->Args({64, 1024, 1})
    ->Args({64, 1024, 4})
    ->Args({64, 1024, 8})
    ->Args({64, 256, 4})
    ->Args({64, 8192, 4})
    ->Name("RangeStream/Read/Buffer")
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Read_File)
    ->Args({64, 1024, 1})
    ->Args({64, 1024, 4})
    ->Args({64, 1024, 8})
    ->Args({64, 8192, 4})
    ->Name("RangeStream/Read/File")
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

// Params: latency us, parallelism, queue depth
BENCHMARK(BM_Read_HighLatency)
    ->Args({2000, 1, 1})
    ->Args({2000, 4, 2})
    ->Args({2000, 16, 2})
    ->Args({2000, 16, 4})
    ->Name("RangeStream/Read/HighLatency")
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK_MAIN();
