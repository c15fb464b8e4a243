#pragma once

#include "beamdrop/storage/store.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace beamdrop::network {

struct DownloadTarget {
    crypto::Hash hash{};
    // File name offered to the browser
    std::string name;
};

// Read-only HTTP endpoint serving one staged blob at GET /download/<hex>.
class DownloadServer {
public:
    DownloadServer(std::shared_ptr<storage::Store> store, DownloadTarget target, std::size_t threads = 2);
    ~DownloadServer();
    
    DownloadServer(const DownloadServer&) = delete;
    DownloadServer& operator=(const DownloadServer&) = delete;
    
    // Binds and starts serving. Throws TransferError(TransportError).
    void start(const std::string& address = "127.0.0.1", std::uint16_t port = 0);
    // Stops accepting and aborts in-flight requests; returns without waiting.
    void stop();
    void join();
    
    bool is_running() const { return running_.load(); }
    std::uint16_t port() const { return port_; }
    std::string local_url() const;
    std::string download_path() const;
    
    const DownloadTarget& target() const { return target_; }
    const std::shared_ptr<storage::Store>& store() const { return store_; }

private:
    void do_accept();
    
    std::shared_ptr<storage::Store> store_;
    DownloadTarget target_;
    std::size_t thread_count_;
    
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_;
    std::string address_;
    std::uint16_t port_;
};

// Replaces characters that would break a quoted header parameter.
std::string sanitize_filename(const std::string& name);

}
