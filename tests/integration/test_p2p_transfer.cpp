#include <gtest/gtest.h>
#include "beamdrop/core/runtime.hpp"
#include "beamdrop/network/ticket.hpp"
#include "beamdrop/transfer/p2p_sender.hpp"
#include "beamdrop/transfer/receiver.hpp"
#include "test_support.hpp"
#include <thread>

using namespace beamdrop::transfer;
using beamdrop::testing::TempDirectory;
using beamdrop::testing::read_file;
using beamdrop::testing::write_file;

namespace {

struct ReceiveRun {
    bool ok = false;
    std::vector<ReceiveStatus> events;
};

ReceiveRun run_receive(const std::string& ticket, const TransferOptions& options) {
    ReceiveChannel channel(8);
    ReceiveRun run;
    std::thread consumer([&] { run.events = beamdrop::testing::drain(channel, std::chrono::seconds(60)); });
    run.ok = receive(ticket, channel, options);
    channel.close();
    consumer.join();
    return run;
}

template<typename T>
std::vector<T> events_of(const std::vector<ReceiveStatus>& events) {
    std::vector<T> matching;
    for (const auto& event : events) {
        if (const auto* value = std::get_if<T>(&event)) {
            matching.push_back(*value);
        }
    }
    return matching;
}

std::string error_message(const std::vector<ReceiveStatus>& events) {
    auto errors = events_of<receive_status::Error>(events);
    return errors.empty() ? "" : errors.back().message;
}

}

class P2PTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.relay_mode = beamdrop::network::RelayMode::Disabled;
        options_.bind_address = "127.0.0.1";
        options_.io_timeout = std::chrono::seconds(10);
        options_.temp_dir = dir_ / "tmp";
        options_.output_dir = dir_ / "out";
        std::filesystem::create_directories(options_.temp_dir);
        std::filesystem::create_directories(options_.output_dir);
    }
    
    void TearDown() override {
        if (handle_) {
            handle_->close_and_wait();
        }
        runtime_->shutdown();
    }
    
    std::string share(const std::filesystem::path& path) {
        handle_ = send_p2p(path, options_, runtime_, send_events_);
        if (!handle_) {
            return "";
        }
        auto events = beamdrop::testing::drain(send_events_, std::chrono::milliseconds(200));
        for (const auto& event : events) {
            if (const auto* ready = std::get_if<send_status::ReadyToSend>(&event)) {
                return ready->ticket;
            }
        }
        return handle_->ticket();
    }
    
    bool receive_staging_exists() const {
        for (const auto& entry : std::filesystem::directory_iterator(options_.temp_dir)) {
            if (entry.path().filename().string().rfind(".beamdrop-recv-", 0) == 0) {
                return true;
            }
        }
        return false;
    }
    
    TempDirectory dir_{"beamdrop_p2p"};
    TransferOptions options_;
    std::shared_ptr<beamdrop::core::Runtime> runtime_ = beamdrop::core::Runtime::create(2);
    SendChannel send_events_{1024};
    std::shared_ptr<SendHandle> handle_;
};

TEST_F(P2PTransferTest, DirectoryRoundTrip) {
    auto big = beamdrop::testing::random_content(3 * 1024 * 1024 + 17, 11);
    write_file(dir_ / "src" / "d" / "x.txt", "hello");
    write_file(dir_ / "src" / "d" / "sub" / "y.txt", "nested file");
    write_file(dir_ / "src" / "d" / "sub" / "big.bin", big);
    
    auto ticket = share(dir_ / "src" / "d");
    ASSERT_EQ(ticket.rfind("blob", 0), 0u);
    
    auto run = run_receive(ticket, options_);
    ASSERT_TRUE(run.ok) << error_message(run.events);
    
    EXPECT_EQ(read_file(dir_ / "out" / "d" / "x.txt"), "hello");
    EXPECT_EQ(read_file(dir_ / "out" / "d" / "sub" / "y.txt"), "nested file");
    EXPECT_TRUE(read_file(dir_ / "out" / "d" / "sub" / "big.bin") == big);
    
    ASSERT_FALSE(run.events.empty());
    EXPECT_TRUE(std::holds_alternative<receive_status::Connecting>(run.events.front()));
    EXPECT_TRUE(std::holds_alternative<receive_status::Done>(run.events.back()));
    
    auto connected = events_of<receive_status::Connected>(run.events);
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0].total_files, 3u);
    EXPECT_EQ(connected[0].total_size, big.size() + 5 + 11);
    
    auto downloading = events_of<receive_status::Downloading>(run.events);
    ASSERT_FALSE(downloading.empty());
    for (std::size_t i = 1; i < downloading.size(); ++i) {
        EXPECT_GE(downloading[i].downloaded, downloading[i - 1].downloaded);
    }
    EXPECT_EQ(downloading.back().downloaded, downloading.back().total);
    
    auto exporting = events_of<receive_status::Exporting>(run.events);
    ASSERT_EQ(exporting.size(), 3u);
    EXPECT_EQ(exporting.back().done_files, 2u);
    
    EXPECT_FALSE(receive_staging_exists());
}

TEST_F(P2PTransferTest, SingleEmptyFile) {
    write_file(dir_ / "src" / "a.txt", "");
    
    auto run = run_receive(share(dir_ / "src" / "a.txt"), options_);
    ASSERT_TRUE(run.ok) << error_message(run.events);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "out" / "a.txt"));
    EXPECT_EQ(std::filesystem::file_size(dir_ / "out" / "a.txt"), 0u);
    
    auto connected = events_of<receive_status::Connected>(run.events);
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0].total_files, 1u);
    EXPECT_EQ(connected[0].total_size, 0u);
}

TEST_F(P2PTransferTest, SendReportsImportProgress) {
    write_file(dir_ / "src" / "d" / "one.txt", "1");
    write_file(dir_ / "src" / "d" / "two.txt", "22");
    
    handle_ = send_p2p(dir_ / "src" / "d", options_, runtime_, send_events_);
    ASSERT_NE(handle_, nullptr);
    auto events = beamdrop::testing::drain(send_events_, std::chrono::milliseconds(200));
    
    ASSERT_EQ(events.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<send_status::Connecting>(events[0]));
    auto first = std::get<send_status::Importing>(events[1]);
    EXPECT_EQ(first.total_files, 2u);
    EXPECT_EQ(first.total_size, 3u);
    EXPECT_EQ(first.done_files, 0u);
    EXPECT_EQ(std::get<send_status::Importing>(events[2]).done_files, 1u);
    EXPECT_TRUE(std::holds_alternative<send_status::ReadyToSend>(events[3]));
    EXPECT_TRUE(std::filesystem::is_directory(handle_->staging_dir()));
}

TEST_F(P2PTransferTest, MissingPathReportsError) {
    handle_ = send_p2p(dir_ / "src" / "nothing-here", options_, runtime_, send_events_);
    EXPECT_EQ(handle_, nullptr);
    
    auto events = beamdrop::testing::drain(send_events_, std::chrono::milliseconds(200));
    ASSERT_FALSE(events.empty());
    EXPECT_TRUE(std::holds_alternative<send_status::Error>(events.back()));
    EXPECT_TRUE(std::filesystem::is_empty(options_.temp_dir));
}

TEST_F(P2PTransferTest, ExistingDestinationIsNotOverwritten) {
    write_file(dir_ / "src" / "notes.txt", "from sender");
    write_file(dir_ / "out" / "notes.txt", "local edits");
    
    auto run = run_receive(share(dir_ / "src" / "notes.txt"), options_);
    EXPECT_FALSE(run.ok);
    EXPECT_NE(error_message(run.events).find("already exists"), std::string::npos);
    EXPECT_EQ(read_file(dir_ / "out" / "notes.txt"), "local edits");
    EXPECT_FALSE(receive_staging_exists());
}

TEST_F(P2PTransferTest, WrongNodeIdIsRejected) {
    write_file(dir_ / "src" / "secret.txt", "for the right peer only");
    auto genuine = beamdrop::network::BlobTicket::parse(share(dir_ / "src" / "secret.txt"));
    
    auto addr = genuine.addr();
    addr.node_id[0] ^= 0xFF;
    beamdrop::network::BlobTicket forged(addr, genuine.hash(), genuine.format());
    
    auto run = run_receive(forged.to_string(), options_);
    EXPECT_FALSE(run.ok);
    EXPECT_NE(error_message(run.events).find("identity"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out" / "secret.txt"));
    EXPECT_FALSE(receive_staging_exists());
}

TEST_F(P2PTransferTest, ClosedSenderIsUnreachable) {
    write_file(dir_ / "src" / "gone.txt", "too late");
    auto ticket = share(dir_ / "src" / "gone.txt");
    auto staging = handle_->staging_dir();
    handle_->close_and_wait();
    EXPECT_FALSE(std::filesystem::exists(staging));
    
    auto run = run_receive(ticket, options_);
    EXPECT_FALSE(run.ok);
    EXPECT_TRUE(std::holds_alternative<receive_status::Error>(run.events.back()));
    EXPECT_EQ(events_of<receive_status::Error>(run.events).size(), 1u);
    EXPECT_FALSE(receive_staging_exists());
}

TEST_F(P2PTransferTest, RawTicketIsRejected) {
    write_file(dir_ / "src" / "raw.txt", "x");
    auto genuine = beamdrop::network::BlobTicket::parse(share(dir_ / "src" / "raw.txt"));
    beamdrop::network::BlobTicket raw(genuine.addr(), genuine.hash(), beamdrop::storage::BlobFormat::Raw);
    
    auto run = run_receive(raw.to_string(), options_);
    EXPECT_FALSE(run.ok);
    ASSERT_EQ(run.events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<receive_status::Error>(run.events[0]));
}

TEST_F(P2PTransferTest, TicketWhitespaceIsTrimmed) {
    write_file(dir_ / "src" / "pasted.txt", "copied from chat");
    auto run = run_receive("  " + share(dir_ / "src" / "pasted.txt") + "\n", options_);
    ASSERT_TRUE(run.ok) << error_message(run.events);
    EXPECT_EQ(read_file(dir_ / "out" / "pasted.txt"), "copied from chat");
}
