#pragma once

#include "beamdrop/network/protocol.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace beamdrop::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    DISCONNECTED,
    CONNECTED,
    AUTHENTICATED,
    CLOSING
};

struct Frame {
    MessageHeader header;
    std::vector<std::uint8_t> payload;
};

// Server side of a peer connection, driven by the server's io_context.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(const MessageHeader&, std::vector<std::uint8_t>)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;
    using WriteHandler = std::function<void()>;
    
    explicit Connection(tcp::socket socket);
    ~Connection();
    
    void start();
    void close();
    
    // on_sent runs once the frame has been handed to the socket; streaming
    // senders use it to pace themselves.
    void send_frame(std::vector<std::uint8_t> frame, WriteHandler on_sent = {});
    void send_raw(MessageType type, std::span<const std::uint8_t> payload, WriteHandler on_sent = {});
    
    template<MessagePayload T>
    void send_message(MessageType type, const T& payload, WriteHandler on_sent = {}) {
        send_frame(encode_frame(type, payload), std::move(on_sent));
    }
    
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }
    
    ConnectionState get_state() const { return state_; }
    void set_state(ConnectionState state) { state_ = state; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }
    std::chrono::steady_clock::time_point get_last_activity() const { return last_activity_; }

private:
    struct PendingWrite {
        std::vector<std::uint8_t> data;
        WriteHandler on_sent;
    };
    
    void do_read_header();
    void do_read_payload(const MessageHeader& header);
    void do_write();
    void handle_message(const MessageHeader& header, std::vector<std::uint8_t> payload);
    void handle_error(const boost::system::error_code& error);
    
    tcp::socket socket_;
    ConnectionState state_;
    std::string remote_endpoint_;
    std::chrono::steady_clock::time_point last_activity_;
    
    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;
    
    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;
    
    std::deque<PendingWrite> write_queue_;
    bool write_in_progress_;
};

// Client side of a peer connection. Every operation blocks the caller and
// fails with TransferError(Timeout) once the deadline passes.
class BlockingConnection {
public:
    explicit BlockingConnection(std::chrono::milliseconds timeout);
    ~BlockingConnection();
    
    BlockingConnection(const BlockingConnection&) = delete;
    BlockingConnection& operator=(const BlockingConnection&) = delete;
    
    void connect(const tcp::endpoint& endpoint);
    void close();
    bool is_open() const { return socket_.is_open(); }
    
    void send_raw(MessageType type, std::span<const std::uint8_t> payload);
    
    template<MessagePayload T>
    void send_message(MessageType type, const T& payload) {
        write(encode_frame(type, payload));
    }
    
    Frame receive();
    
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    void write(const std::vector<std::uint8_t>& frame);
    void read_exact(std::span<std::uint8_t> buffer);
    void run_until_done(bool& done, const char* operation);
    
    boost::asio::io_context io_context_;
    tcp::socket socket_;
    std::chrono::milliseconds timeout_;
    std::string remote_endpoint_;
};

}
