#include <gtest/gtest.h>
#include "beamdrop/storage/fs_store.hpp"
#include "beamdrop/transfer/send_handle.hpp"
#include "test_support.hpp"
#include <atomic>
#include <future>

using namespace beamdrop;
using namespace std::chrono_literals;
using beamdrop::testing::TempDirectory;

namespace {

class CountingTunnel : public network::Tunnel {
public:
    explicit CountingTunnel(std::shared_ptr<std::atomic<int>> closes) : closes_(std::move(closes)) {}
    
    const std::string& public_url() const override { return url_; }
    void close() override { (*closes_)++; }

private:
    std::shared_ptr<std::atomic<int>> closes_;
    std::string url_ = "https://example.invalid";
};

// Tunnel whose close waits until the test opens the gate.
class GatedTunnel : public network::Tunnel {
public:
    explicit GatedTunnel(std::shared_future<void> gate) : gate_(std::move(gate)) {}
    
    const std::string& public_url() const override { return url_; }
    void close() override { gate_.wait(); }

private:
    std::shared_future<void> gate_;
    std::string url_ = "https://example.invalid";
};

}

class SendHandleTest : public ::testing::Test {
protected:
    std::shared_ptr<transfer::SendHandle> make_handle(std::weak_ptr<core::Runtime> runtime) {
        auto staging = transfer::create_staging_dir(dir_.path(), "beamdrop-test-");
        auto handle = std::make_shared<transfer::SendHandle>(std::move(runtime), staging);
        
        auto store = std::make_shared<storage::FsStore>(staging);
        handle->attach_tag(store->add_bytes(std::vector<std::uint8_t>{'h', 'i'}, storage::BlobFormat::Raw));
        handle->attach_store(store);
        handle->attach_tunnel(std::make_unique<CountingTunnel>(tunnel_closes_));
        return handle;
    }
    
    TempDirectory dir_{"beamdrop_handle"};
    std::shared_ptr<core::Runtime> runtime_ = core::Runtime::create(2);
    std::shared_ptr<std::atomic<int>> tunnel_closes_ = std::make_shared<std::atomic<int>>(0);
};

TEST_F(SendHandleTest, StagingDirectoryIsUnique) {
    auto first = transfer::create_staging_dir(dir_.path(), "beamdrop-p2p-");
    auto second = transfer::create_staging_dir(dir_.path(), "beamdrop-p2p-");
    
    EXPECT_NE(first, second);
    EXPECT_TRUE(std::filesystem::is_directory(first));
    EXPECT_EQ(first.filename().string().rfind("beamdrop-p2p-", 0), 0u);
    EXPECT_EQ(first.filename().string().size(), std::string("beamdrop-p2p-").size() + 16);
}

TEST_F(SendHandleTest, CloseReleasesEverything) {
    auto handle = make_handle(runtime_);
    auto staging = handle->staging_dir();
    ASSERT_TRUE(std::filesystem::exists(staging));
    
    auto done = handle->close();
    ASSERT_EQ(done.wait_for(10s), std::future_status::ready);
    
    EXPECT_TRUE(handle->is_closed());
    EXPECT_FALSE(std::filesystem::exists(staging));
    EXPECT_EQ(tunnel_closes_->load(), 1);
    EXPECT_EQ(handle->tunnel(), nullptr);
}

TEST_F(SendHandleTest, CloseIsIdempotent) {
    auto handle = make_handle(runtime_);
    
    auto first = handle->close();
    auto second = handle->close();
    first.wait();
    second.wait();
    handle->close_and_wait();
    
    EXPECT_EQ(tunnel_closes_->load(), 1);
}

TEST_F(SendHandleTest, CloseWithoutRuntimeDoesNotBlock) {
    std::weak_ptr<core::Runtime> expired;
    {
        auto temporary = core::Runtime::create(1);
        expired = temporary;
        temporary->shutdown();
    }
    
    auto handle = make_handle(expired);
    auto staging = handle->staging_dir();
    std::promise<void> gate;
    handle->attach_tunnel(std::make_unique<GatedTunnel>(gate.get_future().share()));
    
    // Returns while the tunnel is still closing
    auto done = handle->close();
    EXPECT_EQ(done.wait_for(100ms), std::future_status::timeout);
    EXPECT_TRUE(std::filesystem::exists(staging));
    
    gate.set_value();
    ASSERT_EQ(done.wait_for(10s), std::future_status::ready);
    EXPECT_FALSE(std::filesystem::exists(staging));
}

TEST_F(SendHandleTest, DroppingWithoutRuntimeReleasesInBackground) {
    std::filesystem::path staging;
    {
        auto handle = make_handle(std::weak_ptr<core::Runtime>());
        staging = handle->staging_dir();
    }
    
    EXPECT_TRUE(beamdrop::testing::eventually([&] { return !std::filesystem::exists(staging); }, 10s));
    EXPECT_EQ(tunnel_closes_->load(), 1);
}

TEST_F(SendHandleTest, CloseAndWaitBlocksUntilReleased) {
    auto handle = make_handle(runtime_);
    auto staging = handle->staging_dir();
    
    handle->close_and_wait();
    EXPECT_FALSE(std::filesystem::exists(staging));
    EXPECT_EQ(tunnel_closes_->load(), 1);
}

TEST_F(SendHandleTest, DestructionReleasesResources) {
    std::filesystem::path staging;
    {
        auto handle = make_handle(runtime_);
        staging = handle->staging_dir();
    }
    
    EXPECT_TRUE(beamdrop::testing::eventually([&] { return !std::filesystem::exists(staging); }, 10s));
    EXPECT_EQ(tunnel_closes_->load(), 1);
}

TEST_F(SendHandleTest, AttachAfterCloseIsIgnored) {
    auto handle = make_handle(runtime_);
    handle->close_and_wait();
    
    handle->attach_tunnel(std::make_unique<CountingTunnel>(tunnel_closes_));
    EXPECT_EQ(handle->tunnel(), nullptr);
    EXPECT_EQ(tunnel_closes_->load(), 1);
}

TEST(StagingDirTest, UnwritableParentThrows) {
    EXPECT_THROW(transfer::create_staging_dir("/proc/beamdrop-no-such-dir", "x-"), core::TransferError);
}
