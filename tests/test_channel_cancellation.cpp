#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "../rangestream/include/rangestream/cancellation.hpp"
#include "../rangestream/include/rangestream/channel.hpp"

using namespace rangestream;
using namespace std::chrono_literals;

// ============================================================================
// CancellationSource
// ============================================================================

TEST(Cancellation, FirstCauseWins) {
    CancellationSource source;
    EXPECT_FALSE(source.is_cancelled());
    EXPECT_FALSE(source.cause().has_value());
    EXPECT_TRUE(source.status().is_ok());

    EXPECT_TRUE(source.cancel(Err(Error::Code::NetworkError, "first")));
    EXPECT_FALSE(source.cancel(Err(Error::Code::Cancelled, "second")));

    ASSERT_TRUE(source.is_cancelled());
    ASSERT_TRUE(source.cause().has_value());
    EXPECT_EQ(source.cause()->code, Error::Code::NetworkError);
    EXPECT_EQ(source.cause()->message, "first");

    auto status = source.status();
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().message, "first");
}

TEST(Cancellation, CallbacksRunOnceOnCancel) {
    CancellationSource source;
    int calls = 0;
    source.subscribe([&] { ++calls; });

    source.cancel(Err(Error::Code::Cancelled));
    source.cancel(Err(Error::Code::Cancelled));
    EXPECT_EQ(calls, 1);
}

TEST(Cancellation, SubscribeAfterCancelRunsImmediately) {
    CancellationSource source;
    source.cancel(Err(Error::Code::Cancelled));

    bool called = false;
    source.subscribe([&] { called = true; });
    EXPECT_TRUE(called);
}

TEST(Cancellation, UnsubscribedCallbackNeverRuns) {
    CancellationSource source;
    bool called = false;
    auto id = source.subscribe([&] { called = true; });
    source.unsubscribe(id);

    source.cancel(Err(Error::Code::Cancelled));
    EXPECT_FALSE(called);
}

TEST(Cancellation, WaitForWakesOnCancel) {
    CancellationSource source;
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        source.cancel(Err(Error::Code::Cancelled));
    });

    auto begin = std::chrono::steady_clock::now();
    EXPECT_TRUE(source.wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    canceller.join();
}

TEST(Cancellation, WaitForTimesOut) {
    CancellationSource source;
    EXPECT_FALSE(source.wait_for(10ms));
}

TEST(Cancellation, DefaultTokenIsNeverCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.status().is_ok());
    EXPECT_FALSE(token.wait_for(1ms));
}

TEST(Cancellation, TokenReflectsSource) {
    CancellationSource source;
    CancellationToken token(source);
    EXPECT_FALSE(token.is_cancelled());

    source.cancel(Err(Error::Code::Timeout, "deadline"));
    EXPECT_TRUE(token.is_cancelled());
    ASSERT_TRUE(token.status().is_error());
    EXPECT_EQ(token.status().error().code, Error::Code::Timeout);
    EXPECT_TRUE(token.wait_for(1s));
}

// ============================================================================
// Channel
// ============================================================================

TEST(Channel, PushPopPreservesOrder) {
    Channel<int> channel(4);
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(channel.push(int{i}).is_ok());
    }
    EXPECT_EQ(channel.size(), 4);

    for (int i = 0; i < 4; ++i) {
        auto item = channel.pop();
        ASSERT_TRUE(item.is_ok());
        ASSERT_TRUE(item.value().has_value());
        EXPECT_EQ(*item.value(), i);
    }
}

TEST(Channel, CapacityIsAtLeastOne) {
    Channel<int> channel(0);
    EXPECT_EQ(channel.capacity(), 1);
}

TEST(Channel, CloseDrainsRemainingItemsThenReportsClosure) {
    Channel<int> channel(4);
    ASSERT_TRUE(channel.push(1).is_ok());
    ASSERT_TRUE(channel.push(2).is_ok());

    EXPECT_TRUE(channel.close());
    EXPECT_FALSE(channel.close());
    EXPECT_TRUE(channel.is_closed());

    auto push = channel.push(3);
    ASSERT_TRUE(push.is_error());
    EXPECT_EQ(push.error().code, Error::Code::ChannelClosed);

    EXPECT_EQ(*channel.pop().value(), 1);
    EXPECT_EQ(*channel.pop().value(), 2);

    auto end = channel.pop();
    ASSERT_TRUE(end.is_ok());
    EXPECT_FALSE(end.value().has_value());
}

TEST(Channel, PushBlocksWhileFull) {
    Channel<int> channel(1);
    ASSERT_TRUE(channel.push(1).is_ok());

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        EXPECT_TRUE(channel.push(2).is_ok());
        pushed = true;
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(*channel.pop().value(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(*channel.pop().value(), 2);
}

TEST(Channel, PopUnblocksOnClose) {
    Channel<int> channel(1);
    std::thread closer([&] {
        std::this_thread::sleep_for(20ms);
        channel.close();
    });

    auto item = channel.pop();
    ASSERT_TRUE(item.is_ok());
    EXPECT_FALSE(item.value().has_value());
    closer.join();
}

TEST(Channel, BlockedPopReturnsCancellationCause) {
    CancellationSource cancel;
    Channel<int> channel(1, &cancel);

    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        cancel.cancel(Err(Error::Code::NetworkError, "connection reset"));
    });

    auto item = channel.pop();
    ASSERT_TRUE(item.is_error());
    EXPECT_EQ(item.error().code, Error::Code::NetworkError);
    EXPECT_EQ(item.error().message, "connection reset");
    canceller.join();
}

TEST(Channel, BlockedPushReturnsCancellationCause) {
    CancellationSource cancel;
    Channel<int> channel(1, &cancel);
    ASSERT_TRUE(channel.push(1).is_ok());

    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        cancel.cancel(Err(Error::Code::Cancelled, "closed"));
    });

    auto push = channel.push(2);
    ASSERT_TRUE(push.is_error());
    EXPECT_EQ(push.error().code, Error::Code::Cancelled);
    canceller.join();
}

TEST(Channel, CancellationTakesPrecedenceOverQueuedItems) {
    CancellationSource cancel;
    Channel<int> channel(2, &cancel);
    ASSERT_TRUE(channel.push(1).is_ok());

    cancel.cancel(Err(Error::Code::Cancelled));
    auto item = channel.pop();
    ASSERT_TRUE(item.is_error());
    EXPECT_EQ(item.error().code, Error::Code::Cancelled);

    // Items can still be reclaimed for cleanup
    auto rest = channel.drain();
    ASSERT_EQ(rest.size(), 1);
    EXPECT_EQ(rest.front(), 1);
}

TEST(Channel, PopUntilTimesOut) {
    Channel<int> channel(1);
    auto item = channel.pop_until(std::chrono::steady_clock::now() + 20ms);
    ASSERT_TRUE(item.is_error());
    EXPECT_EQ(item.error().code, Error::Code::Timeout);
}

TEST(Channel, ChannelCreatedAfterCancelFailsImmediately) {
    CancellationSource cancel;
    cancel.cancel(Err(Error::Code::Cancelled, "already"));

    Channel<int> channel(1, &cancel);
    auto item = channel.pop();
    ASSERT_TRUE(item.is_error());
    EXPECT_EQ(item.error().message, "already");
}

TEST(Channel, MoveOnlyItems) {
    Channel<std::unique_ptr<int>> channel(2);
    ASSERT_TRUE(channel.push(std::make_unique<int>(42)).is_ok());

    auto item = channel.pop();
    ASSERT_TRUE(item.is_ok());
    ASSERT_TRUE(item.value().has_value());
    EXPECT_EQ(**item.value(), 42);
}

TEST(Channel, ManyProducersManyConsumers) {
    constexpr int producers = 4;
    constexpr int per_producer = 500;
    Channel<int> channel(8);
    std::atomic<long long> sum{0};
    std::atomic<int> received{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&] {
            while (true) {
                auto item = channel.pop();
                if (!item || !item.value()) {
                    return;
                }
                sum += *item.value();
                received++;
            }
        });
    }

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&] {
            for (int i = 1; i <= per_producer; ++i) {
                EXPECT_TRUE(channel.push(int{i}).is_ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    channel.close();
    for (auto& thread : consumers) {
        thread.join();
    }

    EXPECT_EQ(received.load(), producers * per_producer);
    EXPECT_EQ(sum.load(), static_cast<long long>(producers) * per_producer * (per_producer + 1) / 2);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
