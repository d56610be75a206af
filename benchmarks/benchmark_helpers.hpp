#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <span>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "../rangestream/include/rangestream/cancellation.hpp"
#include "../rangestream/include/rangestream/reader_base.hpp"
#include "../rangestream/include/rangestream/readers/reader_buffer.hpp"

namespace rangestream_bench {

using namespace rangestream;

/// Content pattern for generated objects
enum class ContentPattern {
    Sequential,
    Random,
    Constant
};

/// Object to read during a benchmark
struct ObjectConfig {
    std::size_t size;
    std::size_t part_size;
    std::size_t parallelism;
    std::size_t queue_depth = 2;

    std::string name() const;
};

/// Object content generator
class ContentGenerator {
public:
    explicit ContentGenerator(uint64_t seed = 42) : rng_(seed) {}

    std::vector<std::byte> generate(std::size_t size, ContentPattern pattern);

private:
    std::mt19937_64 rng_;
};

/// Temporary file manager for benchmarks
class TempFileManager {
public:
    TempFileManager();
    ~TempFileManager();

    /// Get path for a temporary object file
    std::filesystem::path get_temp_path(const std::string& name);

    /// Write content to a new temporary file
    std::filesystem::path create_file(const std::string& name, std::span<const std::byte> content);

    /// Clean up all temporary files
    void cleanup_all();

private:
    std::filesystem::path temp_dir_;
    std::vector<std::filesystem::path> temp_files_;
};

/// In-memory source where every get() pays a fixed latency first,
/// standing in for the round trip of a remote range request
class LatencySource {
public:
    using BodyType = BufferViewSource::BodyType;

    LatencySource(std::span<const std::byte> data, std::chrono::microseconds latency) noexcept
        : inner_(data), latency_(latency) {}

    [[nodiscard]] Result<BodyType> get(std::size_t offset, std::size_t length, CancellationToken token) const noexcept {
        if (token.wait_for(latency_)) {
            return token.status().error();
        }
        return inner_.get(offset, length, token);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept { return inner_.size(); }
    [[nodiscard]] bool is_valid() const noexcept { return inner_.is_valid(); }

private:
    BufferViewSource inner_;
    std::chrono::microseconds latency_;
};

static_assert(RangeSource<LatencySource>, "LatencySource must satisfy RangeSource concept");

} // namespace rangestream_bench
