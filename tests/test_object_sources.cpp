#include <gtest/gtest.h>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "../rangestream/include/rangestream/cancellation.hpp"
#include "../rangestream/include/rangestream/readers/reader_buffer.hpp"
#include "../rangestream/include/rangestream/readers/reader_stream.hpp"

#ifdef __unix__
#include "../rangestream/include/rangestream/readers/reader_unix_pread.hpp"
#endif

#include "test_helpers.hpp"

namespace fs = std::filesystem;
using namespace rangestream;
using rangestream_test::create_test_file;

// Read a whole body, in slices of at most slice bytes
template <typename Body>
Result<std::vector<std::byte>> drain_body(Body& body, std::size_t slice = 64) {
    std::vector<std::byte> out;
    std::vector<std::byte> chunk(slice);
    while (true) {
        auto n = body.read_some(std::span<std::byte>(chunk));
        if (!n) {
            return n.error();
        }
        if (n.value() == 0) {
            break;
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n.value()));
    }
    return Ok(std::move(out));
}

// ============================================================================
// Test Fixtures
// ============================================================================

template <typename SourceT>
class RangeSourceTest : public ::testing::Test {
protected:
    std::vector<std::byte> test_data;
    fs::path test_file_path;

    void SetUp() override {
        test_data.resize(1024);
        for (size_t i = 0; i < test_data.size(); ++i) {
            test_data[i] = static_cast<std::byte>(i % 256);
        }
        test_file_path = create_test_file("test_range_source_file.bin", test_data);
    }

    void TearDown() override {
        if (fs::exists(test_file_path)) {
            fs::remove(test_file_path);
        }
    }

    SourceT create_source();
};

// Specialization for BufferViewSource (borrowed buffer)
template <>
BufferViewSource RangeSourceTest<BufferViewSource>::create_source() {
    return BufferViewSource(std::span<const std::byte>(test_data));
}

// Specialization for BufferSource (owned buffer)
template <>
BufferSource RangeSourceTest<BufferSource>::create_source() {
    return BufferSource(std::span<const std::byte>(test_data));
}

// Specialization for StreamFileSource
template <>
StreamFileSource RangeSourceTest<StreamFileSource>::create_source() {
    return StreamFileSource(test_file_path.string());
}

#ifdef __unix__
// Specialization for PreadFileSource
template <>
PreadFileSource RangeSourceTest<PreadFileSource>::create_source() {
    return PreadFileSource(test_file_path.string());
}
#endif

using SourceTypes = ::testing::Types<
    BufferViewSource
    , BufferSource
    , StreamFileSource
#ifdef __unix__
    , PreadFileSource
#endif
>;

TYPED_TEST_SUITE(RangeSourceTest, SourceTypes);

// ============================================================================
// Basic RangeSource Tests
// ============================================================================

TYPED_TEST(RangeSourceTest, IsValidAfterConstruction) {
    auto source = this->create_source();
    EXPECT_TRUE(source.is_valid());
}

TYPED_TEST(RangeSourceTest, SizeReturnsCorrectValue) {
    auto source = this->create_source();
    auto size_result = source.size();

    ASSERT_TRUE(size_result.is_ok());
    EXPECT_EQ(size_result.value(), this->test_data.size());
}

TYPED_TEST(RangeSourceTest, GetEntireObject) {
    auto source = this->create_source();
    auto body_result = source.get(0, this->test_data.size(), CancellationToken{});
    ASSERT_TRUE(body_result.is_ok());

    auto body = std::move(body_result.value());
    auto data = drain_body(body);
    ASSERT_TRUE(data.is_ok());
    EXPECT_EQ(data.value(), this->test_data);
    EXPECT_TRUE(body.close().is_ok());
}

TYPED_TEST(RangeSourceTest, GetPartialRange) {
    auto source = this->create_source();
    auto body_result = source.get(50, 100, CancellationToken{});
    ASSERT_TRUE(body_result.is_ok());

    auto body = std::move(body_result.value());
    auto data = drain_body(body, 7);
    ASSERT_TRUE(data.is_ok());
    ASSERT_EQ(data.value().size(), 100);
    EXPECT_EQ(std::memcmp(data.value().data(), this->test_data.data() + 50, 100), 0);
}

TYPED_TEST(RangeSourceTest, GetAtEndOfObject) {
    auto source = this->create_source();
    auto body_result = source.get(this->test_data.size() - 10, 10, CancellationToken{});
    ASSERT_TRUE(body_result.is_ok());

    auto body = std::move(body_result.value());
    auto data = drain_body(body);
    ASSERT_TRUE(data.is_ok());
    ASSERT_EQ(data.value().size(), 10);
    EXPECT_EQ(std::memcmp(data.value().data(), this->test_data.data() + this->test_data.size() - 10, 10), 0);
}

TYPED_TEST(RangeSourceTest, GetBeyondEndReturnsError) {
    auto source = this->create_source();
    auto body_result = source.get(this->test_data.size() + 100, 10, CancellationToken{});

    ASSERT_TRUE(body_result.is_error());
    EXPECT_EQ(body_result.error().code, Error::Code::OutOfBounds);
}

TYPED_TEST(RangeSourceTest, GetMoreThanAvailableTruncates) {
    auto source = this->create_source();
    auto body_result = source.get(this->test_data.size() - 10, 50, CancellationToken{});
    ASSERT_TRUE(body_result.is_ok());

    auto body = std::move(body_result.value());
    auto data = drain_body(body);
    ASSERT_TRUE(data.is_ok());
    EXPECT_EQ(data.value().size(), 10);
}

TYPED_TEST(RangeSourceTest, BodyObservesCancellation) {
    auto source = this->create_source();
    CancellationSource cancel;
    auto body_result = source.get(0, 100, CancellationToken(cancel));
    ASSERT_TRUE(body_result.is_ok());
    auto body = std::move(body_result.value());

    std::vector<std::byte> chunk(10);
    auto first = body.read_some(std::span<std::byte>(chunk));
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value(), 10);

    cancel.cancel(Err(Error::Code::Cancelled, "stop"));
    auto second = body.read_some(std::span<std::byte>(chunk));
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, Error::Code::Cancelled);
    EXPECT_EQ(second.error().message, "stop");
}

TYPED_TEST(RangeSourceTest, ReadAfterCloseFails) {
    auto source = this->create_source();
    auto body_result = source.get(0, 10, CancellationToken{});
    ASSERT_TRUE(body_result.is_ok());
    auto body = std::move(body_result.value());

    EXPECT_TRUE(body.close().is_ok());
    EXPECT_TRUE(body.close().is_ok());

    std::vector<std::byte> chunk(10);
    auto n = body.read_some(std::span<std::byte>(chunk));
    ASSERT_TRUE(n.is_error());
    EXPECT_EQ(n.error().code, Error::Code::InvalidOperation);
}

TYPED_TEST(RangeSourceTest, ThreadSafeGets) {
    auto source = this->create_source();
    std::vector<std::thread> threads;
    std::atomic<int> errors{0};

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 10; ++i) {
                size_t offset = (t * 37 + i * 13) % (this->test_data.size() - 40);
                auto body_result = source.get(offset, 40, CancellationToken{});
                if (!body_result) {
                    errors++;
                    continue;
                }
                auto body = std::move(body_result.value());
                auto data = drain_body(body, 9);
                if (!data || data.value().size() != 40 ||
                    std::memcmp(data.value().data(), this->test_data.data() + offset, 40) != 0) {
                    errors++;
                }
                (void)body.close();
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(errors.load(), 0);
}

// ============================================================================
// Corner Cases
// ============================================================================

TEST(CornerCases, EmptyBufferSource) {
    std::vector<std::byte> empty;
    BufferViewSource source{std::span<const std::byte>(empty)};

    EXPECT_TRUE(source.is_valid());
    ASSERT_TRUE(source.size().is_ok());
    EXPECT_EQ(source.size().value(), 0);

    auto body_result = source.get(10, 1, CancellationToken{});
    ASSERT_TRUE(body_result.is_error());
    EXPECT_EQ(body_result.error().code, Error::Code::OutOfBounds);
}

TEST(CornerCases, ReadIntoEmptySpan) {
    std::vector<std::byte> data(16, std::byte{1});
    BufferSource source{std::span<const std::byte>(data)};

    auto body_result = source.get(0, 16, CancellationToken{});
    ASSERT_TRUE(body_result.is_ok());
    auto body = std::move(body_result.value());

    auto n = body.read_some(std::span<std::byte>{});
    ASSERT_TRUE(n.is_ok());
    EXPECT_EQ(n.value(), 0);
    EXPECT_EQ(body.remaining(), 16);
}

TEST(CornerCases, NonExistentFile) {
    StreamFileSource source("/nonexistent/path/to/object.bin");
    EXPECT_FALSE(source.is_valid());

    auto body_result = source.get(0, 10, CancellationToken{});
    ASSERT_TRUE(body_result.is_error());
    EXPECT_EQ(body_result.error().code, Error::Code::ReadError);

    StreamFileSource reopened;
    auto open_result = reopened.open("/nonexistent/path/to/object.bin");
    ASSERT_TRUE(open_result.is_error());
    EXPECT_EQ(open_result.error().code, Error::Code::FileNotFound);
}

#ifdef __unix__
TEST(CornerCases, PreadSourceMoveTransfersDescriptor) {
    std::vector<std::byte> data(64, std::byte{0x5A});
    auto path = create_test_file("test_pread_move.bin", data);

    PreadFileSource first(path.string());
    ASSERT_TRUE(first.is_valid());

    PreadFileSource second(std::move(first));
    EXPECT_FALSE(first.is_valid());
    ASSERT_TRUE(second.is_valid());
    EXPECT_EQ(second.size().value(), 64);

    auto body_result = second.get(0, 64, CancellationToken{});
    ASSERT_TRUE(body_result.is_ok());
    auto body = std::move(body_result.value());
    auto read = drain_body(body);
    ASSERT_TRUE(read.is_ok());
    EXPECT_EQ(read.value(), data);

    fs::remove(path);
}
#endif

TEST(CornerCases, FileBodiesDeliverLargeRangesInSlices) {
    std::vector<std::byte> data = rangestream_test::make_pattern(3 * 1024 * 1024 + 17);
    auto path = create_test_file("test_large_range_source.bin", data);

    StreamFileSource source(path.string());
    ASSERT_TRUE(source.is_valid());

    auto body_result = source.get(0, data.size(), CancellationToken{});
    ASSERT_TRUE(body_result.is_ok());
    auto body = std::move(body_result.value());

    std::vector<std::byte> out(data.size());
    auto n = body.read_some(std::span<std::byte>(out));
    ASSERT_TRUE(n.is_ok());
    EXPECT_EQ(n.value(), stream_impl::max_slice_size);

    auto rest = drain_body(body, 1024 * 1024);
    ASSERT_TRUE(rest.is_ok());
    EXPECT_EQ(n.value() + rest.value().size(), data.size());
    EXPECT_EQ(std::memcmp(out.data(), data.data(), n.value()), 0);
    EXPECT_EQ(std::memcmp(rest.value().data(), data.data() + n.value(), rest.value().size()), 0);

    fs::remove(path);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
