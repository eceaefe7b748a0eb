// test/unit/test_channel.cpp
// -----------------------------------------------------------
// Channel disconnect semantics and the worker pool.

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "util/channel.hpp"
#include "util/thread_pool.hpp"

namespace {

using namespace portal::util;

TEST(ChannelTest, SendThenReceiveInOrder) {
    auto channel = makeChannel<int>();
    EXPECT_TRUE(channel.first.send(1));
    EXPECT_TRUE(channel.first.send(2));

    int value = 0;
    EXPECT_EQ(channel.second.tryRecv(value), RecvStatus::Value);
    EXPECT_EQ(value, 1);
    EXPECT_EQ(channel.second.tryRecv(value), RecvStatus::Value);
    EXPECT_EQ(value, 2);
    EXPECT_EQ(channel.second.tryRecv(value), RecvStatus::Empty);
}

// Queued values are still delivered after the last sender is gone
TEST(ChannelTest, DisconnectAfterDrain) {
    auto channel = makeChannel<int>();
    Receiver<int> rx = std::move(channel.second);
    {
        Sender<int> tx = std::move(channel.first);
        Sender<int> copy = tx;
        copy.send(7);
    }

    int value = 0;
    EXPECT_EQ(rx.tryRecv(value), RecvStatus::Value);
    EXPECT_EQ(value, 7);
    EXPECT_EQ(rx.tryRecv(value), RecvStatus::Disconnected);
    EXPECT_FALSE(rx.recv().has_value());
    EXPECT_TRUE(rx.isDisconnected());
}

TEST(ChannelTest, SendFailsWhenReceiverDropped) {
    auto channel = makeChannel<int>();
    Sender<int> tx = channel.first;
    EXPECT_TRUE(tx.isConnected());
    channel.second.close();
    EXPECT_FALSE(tx.isConnected());
    EXPECT_FALSE(tx.send(1));
}

TEST(ChannelTest, RecvBlocksUntilValue) {
    auto channel = makeChannel<int>();
    Sender<int> tx = std::move(channel.first);
    std::thread producer([tx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        tx.send(42);
    });
    std::optional<int> value = channel.second.recv();
    producer.join();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);
}

TEST(ChannelTest, RecvForTimesOut) {
    auto channel = makeChannel<int>();
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.second.recvFor(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
    EXPECT_FALSE(channel.second.isDisconnected());
}

TEST(ThreadPoolTest, RunsQueuedTasks) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(3);
        EXPECT_EQ(pool.size(), (size_t)3);
        std::vector<std::future<int>> results;
        for (int i = 0; i < 10; ++i) {
            results.push_back(pool.enqueue([&counter](int x) {
                ++counter;
                return x * x;
            }, i));
        }
        EXPECT_EQ(results[4].get(), 16);
    }
    EXPECT_EQ(counter.load(), 10);
}

// Move-only state can travel into a job
TEST(ThreadPoolTest, AcceptsMoveOnlyCapture) {
    auto channel = makeChannel<int>();
    ThreadPool pool(1);
    auto done = pool.enqueue([rx = std::move(channel.second)]() mutable {
        return rx.recv().value_or(-1);
    });
    channel.first.send(5);
    EXPECT_EQ(done.get(), 5);
}

} // namespace
