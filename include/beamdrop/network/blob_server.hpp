#pragma once

#include "beamdrop/network/connection.hpp"
#include "beamdrop/network/endpoint.hpp"
#include "beamdrop/storage/store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace beamdrop::network {

// Serves blobs from a store to authenticated peers on the endpoint's
// listener. Runs the endpoint's io_context on its own thread.
class BlobServer {
public:
    BlobServer(Endpoint& endpoint, std::shared_ptr<storage::Store> store);
    ~BlobServer();
    
    BlobServer(const BlobServer&) = delete;
    BlobServer& operator=(const BlobServer&) = delete;
    
    bool start();
    // Stops accepting and drops every connection; returns without waiting.
    void stop();
    // Waits for the I/O thread to exit.
    void join();
    
    bool is_running() const { return running_.load(); }
    std::size_t connection_count() const;
    std::uint64_t bytes_served() const { return bytes_served_.load(); }

private:
    void do_accept();
    void handle_new_connection(std::shared_ptr<Connection> connection);
    void handle_connection_closed(std::shared_ptr<Connection> connection);
    void handle_message(std::shared_ptr<Connection> connection, const MessageHeader& header,
                        std::vector<std::uint8_t> payload);
    
    void handle_handshake(std::shared_ptr<Connection> connection, const HandshakeMessage& msg);
    void handle_get(std::shared_ptr<Connection> connection, const GetRequestMessage& msg);
    void handle_size_request(std::shared_ptr<Connection> connection, const SizeRequestMessage& msg);
    void send_next_chunk(std::shared_ptr<Connection> connection,
                         std::shared_ptr<storage::BlobReader> reader, const crypto::Hash& hash);
    void send_error(std::shared_ptr<Connection> connection, ErrorCode code,
                    const std::string& message, bool close_after = false);
    void shutdown_io();
    
    Endpoint& endpoint_;
    std::shared_ptr<storage::Store> store_;
    
    std::thread server_thread_;
    std::atomic<bool> running_;
    std::atomic<std::uint64_t> bytes_served_;
    
    std::set<std::shared_ptr<Connection>> connections_;
    mutable std::mutex connections_mutex_;
};

}
