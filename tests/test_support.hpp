#pragma once

#include "beamdrop/core/error.hpp"
#include "beamdrop/core/event_channel.hpp"
#include "beamdrop/crypto/random.hpp"
#include "beamdrop/network/tunnel.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace beamdrop::testing {

// Unique directory under the system temp dir, removed on destruction.
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "beamdrop_test") {
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(crypto::SecureRandom::generate_uint64()));
        std::filesystem::create_directories(path_);
    }
    
    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    
    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Deterministic pseudo-random content
inline std::string random_content(std::size_t size, unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string content(size, '\0');
    for (auto& c : content) {
        c = static_cast<char>(dist(rng));
    }
    return content;
}

// Collects events until the channel closes or the timeout passes.
template<typename T>
std::vector<T> drain(core::EventChannel<T>& channel,
                     std::chrono::milliseconds timeout = std::chrono::seconds(20)) {
    std::vector<T> events;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto event = channel.recv_for(std::chrono::milliseconds(100));
        if (event) {
            events.push_back(std::move(*event));
        } else if (channel.is_closed()) {
            break;
        }
    }
    return events;
}

// Reads events until one satisfies the predicate; returns it.
template<typename T, typename Predicate>
std::optional<T> wait_for_event(core::EventChannel<T>& channel, Predicate predicate,
                                std::vector<T>* seen = nullptr,
                                std::chrono::milliseconds timeout = std::chrono::seconds(20)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto event = channel.recv_for(std::chrono::milliseconds(100));
        if (!event) {
            if (channel.is_closed()) {
                break;
            }
            continue;
        }
        if (seen) {
            seen->push_back(*event);
        }
        if (predicate(*event)) {
            return event;
        }
    }
    return std::nullopt;
}

template<typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

// Tunnel that "publishes" the local URL unchanged, for loopback tests.
class LoopbackTunnelConnector : public network::TunnelConnector {
public:
    std::unique_ptr<network::Tunnel> open(const std::string& local_url) override {
        opened++;
        return std::make_unique<LoopbackTunnel>(local_url, closed);
    }
    
    std::atomic<int> opened{0};
    std::shared_ptr<std::atomic<int>> closed = std::make_shared<std::atomic<int>>(0);

private:
    class LoopbackTunnel : public network::Tunnel {
    public:
        LoopbackTunnel(std::string url, std::shared_ptr<std::atomic<int>> closed)
            : url_(std::move(url)), closed_(std::move(closed)) {}
        
        const std::string& public_url() const override { return url_; }
        
        void close() override {
            if (!done_) {
                done_ = true;
                (*closed_)++;
            }
        }
    
    private:
        std::string url_;
        std::shared_ptr<std::atomic<int>> closed_;
        bool done_ = false;
    };
};

// Fails every open the way a missing authtoken does.
class FailingTunnelConnector : public network::TunnelConnector {
public:
    std::unique_ptr<network::Tunnel> open(const std::string&) override {
        throw core::TransferError(core::ErrorCode::TunnelAuthError, "no ngrok authtoken found");
    }
};

}
