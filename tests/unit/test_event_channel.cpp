#include <gtest/gtest.h>
#include "beamdrop/core/event_channel.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/transfer/status.hpp"
#include <atomic>
#include <thread>

using namespace beamdrop;
using namespace std::chrono_literals;

TEST(EventChannelTest, DeliversInOrder) {
    core::EventChannel<int> channel(8);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(channel.send(i));
    }
    for (int i = 0; i < 5; ++i) {
        auto value = channel.try_recv();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
    EXPECT_FALSE(channel.try_recv().has_value());
}

TEST(EventChannelTest, FullChannelBlocksProducer) {
    core::EventChannel<int> channel(2);
    std::atomic<int> sent{0};
    
    std::thread producer([&] {
        for (int i = 0; i < 4; ++i) {
            channel.send(i);
            sent++;
        }
    });
    
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(sent.load(), 2);
    EXPECT_EQ(channel.size(), 2u);
    
    for (int i = 0; i < 4; ++i) {
        auto value = channel.recv_for(2s);
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
    producer.join();
    EXPECT_EQ(sent.load(), 4);
}

TEST(EventChannelTest, CloseReleasesBlockedProducer) {
    core::EventChannel<int> channel(1);
    ASSERT_TRUE(channel.send(1));
    
    std::atomic<bool> result{true};
    std::thread producer([&] { result = channel.send(2); });
    
    std::this_thread::sleep_for(50ms);
    channel.close();
    producer.join();
    
    EXPECT_FALSE(result.load());
    // Events queued before close stay readable
    EXPECT_EQ(channel.recv().value_or(-1), 1);
    EXPECT_FALSE(channel.recv().has_value());
}

TEST(EventChannelTest, RecvForTimesOut) {
    core::EventChannel<int> channel;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.recv_for(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST(StatusTest, EmitFailsOnClosedChannel) {
    transfer::SendChannel channel(4);
    transfer::emit(channel, transfer::SendStatus{transfer::send_status::Connecting{}});
    channel.close();
    
    try {
        transfer::emit(channel, transfer::SendStatus{transfer::send_status::Done{}});
        FAIL() << "expected ChannelClosed";
    } catch (const core::TransferError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ChannelClosed);
    }
}

TEST(StatusTest, TerminalStates) {
    using namespace transfer;
    EXPECT_FALSE(is_terminal(SendStatus{send_status::ReadyToSend{"blobabc"}}));
    EXPECT_TRUE(is_terminal(SendStatus{send_status::Done{}}));
    EXPECT_TRUE(is_terminal(SendStatus{send_status::Error{"boom"}}));
    EXPECT_FALSE(is_terminal(ReceiveStatus{receive_status::Downloading{10, 20}}));
    EXPECT_TRUE(is_terminal(ReceiveStatus{receive_status::Done{}}));
}

TEST(StatusTest, DescribeMentionsProgress) {
    using namespace transfer;
    auto text = describe(ReceiveStatus{receive_status::Exporting{3, 1}});
    EXPECT_NE(text.find("1"), std::string::npos);
    EXPECT_NE(text.find("3"), std::string::npos);
    EXPECT_NE(describe(SendStatus{send_status::Error{"disk full"}}).find("disk full"), std::string::npos);
}
