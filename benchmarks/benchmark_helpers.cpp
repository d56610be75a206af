#include "benchmark_helpers.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace rangestream_bench {

// ============================================================================
// ObjectConfig
// ============================================================================

std::string ObjectConfig::name() const {
    std::ostringstream oss;
    oss << (size >> 20) << "MiB";
    if (part_size >= (1u << 20)) {
        oss << "_part" << (part_size >> 20) << "MiB";
    } else {
        oss << "_part" << (part_size >> 10) << "KiB";
    }
    oss << "_p" << parallelism << "_q" << queue_depth;
    return oss.str();
}

// ============================================================================
// ContentGenerator
// ============================================================================

std::vector<std::byte> ContentGenerator::generate(std::size_t size, ContentPattern pattern) {
    std::vector<std::byte> data(size);
    switch (pattern) {
        case ContentPattern::Sequential:
            for (std::size_t i = 0; i < size; ++i) {
                data[i] = static_cast<std::byte>(i & 0xFF);
            }
            break;
        case ContentPattern::Random: {
            std::uniform_int_distribution<int> dist(0, 255);
            for (auto& b : data) {
                b = static_cast<std::byte>(dist(rng_));
            }
            break;
        }
        case ContentPattern::Constant:
            std::fill(data.begin(), data.end(), std::byte{0x42});
            break;
    }
    return data;
}

// ============================================================================
// TempFileManager
// ============================================================================

TempFileManager::TempFileManager() {
    temp_dir_ = std::filesystem::temp_directory_path() / "rangestream_benchmarks";
    std::filesystem::create_directories(temp_dir_);
}

TempFileManager::~TempFileManager() {
    cleanup_all();
}

std::filesystem::path TempFileManager::get_temp_path(const std::string& name) {
    auto path = temp_dir_ / (name + ".bin");
    temp_files_.push_back(path);
    return path;
}

std::filesystem::path TempFileManager::create_file(const std::string& name, std::span<const std::byte> content) {
    auto path = get_temp_path(name);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    return path;
}

void TempFileManager::cleanup_all() {
    for (const auto& path : temp_files_) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        // Ignore errors during cleanup
    }
    temp_files_.clear();

    std::error_code ec;
    std::filesystem::remove(temp_dir_, ec);
}

} // namespace rangestream_bench
