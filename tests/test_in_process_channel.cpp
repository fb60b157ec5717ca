// tests/test_in_process_channel.cpp
#include "wallet/in_process_channel.h"
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>

namespace FairSlot {
namespace {

using std::chrono::milliseconds;

TEST(InProcessChannelTest, DeliversEventsToSubscribersOfTopic) {
    InProcessChannel channel(2, 3, milliseconds(1));
    
    std::mutex mutex;
    std::set<std::int64_t> versions;
    std::atomic<int> other_topic_calls{0};
    
    channel.Subscribe("wallet.sync", [&](const ReconciliationEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        versions.insert(event.version);
    });
    channel.Subscribe("other", [&](const ReconciliationEvent&) { other_topic_calls++; });
    
    for (int i = 1; i <= 20; ++i) {
        channel.Publish("wallet.sync", ReconciliationEvent("alice", i * 10, i));
    }
    channel.Drain();
    
    EXPECT_EQ(versions.size(), 20u);
    EXPECT_EQ(other_topic_calls.load(), 0);
    
    auto stats = channel.GetStats();
    EXPECT_EQ(stats.published, 20);
    EXPECT_EQ(stats.delivered, 20);
    EXPECT_EQ(stats.dropped, 0);
}

TEST(InProcessChannelTest, FailingHandlerIsRetried) {
    InProcessChannel channel(1, 3, milliseconds(1));
    
    std::atomic<int> attempts{0};
    channel.Subscribe("wallet.sync", [&](const ReconciliationEvent&) {
        if (++attempts < 3) {
            throw std::runtime_error("store unavailable");
        }
    });
    
    channel.Publish("wallet.sync", ReconciliationEvent("alice", 100, 1));
    channel.Drain();
    
    EXPECT_EQ(attempts.load(), 3);
    auto stats = channel.GetStats();
    EXPECT_EQ(stats.delivered, 1);
    EXPECT_EQ(stats.redeliveries, 2);
    EXPECT_EQ(stats.dropped, 0);
}

TEST(InProcessChannelTest, EventIsDroppedAfterMaxAttempts) {
    InProcessChannel channel(1, 2, milliseconds(1));
    
    std::atomic<int> attempts{0};
    channel.Subscribe("wallet.sync", [&](const ReconciliationEvent&) {
        attempts++;
        throw std::runtime_error("always failing");
    });
    
    channel.Publish("wallet.sync", ReconciliationEvent("alice", 100, 1));
    channel.Drain();
    
    EXPECT_EQ(attempts.load(), 2);
    auto stats = channel.GetStats();
    EXPECT_EQ(stats.delivered, 0);
    EXPECT_EQ(stats.dropped, 1);
}

TEST(InProcessChannelTest, PublishWithoutSubscribersCountsAsDropped) {
    InProcessChannel channel(1, 3);
    channel.Publish("nobody.listens", ReconciliationEvent("alice", 1, 1));
    channel.Drain();
    
    auto stats = channel.GetStats();
    EXPECT_EQ(stats.published, 1);
    EXPECT_EQ(stats.dropped, 1);
}

TEST(InProcessChannelTest, PublishAfterShutdownThrows) {
    InProcessChannel channel(1, 3);
    channel.Shutdown();
    EXPECT_THROW(channel.Publish("wallet.sync", ReconciliationEvent("alice", 1, 1)),
                 std::runtime_error);
}

} // namespace
} // namespace FairSlot
