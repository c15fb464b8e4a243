#include "beamdrop/network/connection.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace beamdrop::network {

using core::TransferError;

Connection::Connection(tcp::socket socket)
    : socket_(std::move(socket))
    , state_(ConnectionState::CONNECTED)
    , last_activity_(std::chrono::steady_clock::now())
    , write_in_progress_(false) {
    
    boost::system::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    if (ec) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    } else {
        remote_endpoint_ = remote.address().to_string() + ":" + std::to_string(remote.port());
    }
    
    LOG_DEBUG("New connection from {}", remote_endpoint_);
}

Connection::~Connection() {
    LOG_DEBUG("Connection to {} destroyed", remote_endpoint_);
}

void Connection::start() {
    do_read_header();
}

void Connection::close() {
    if (state_ == ConnectionState::DISCONNECTED || state_ == ConnectionState::CLOSING) {
        return;
    }
    
    state_ = ConnectionState::CLOSING;
    LOG_DEBUG("Closing connection to {}", remote_endpoint_);
    
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    
    state_ = ConnectionState::DISCONNECTED;
    write_queue_.clear();
    
    if (disconnect_handler_) {
        auto handler = std::move(disconnect_handler_);
        handler(shared_from_this());
    }
}

void Connection::send_frame(std::vector<std::uint8_t> frame, WriteHandler on_sent) {
    if (state_ != ConnectionState::CONNECTED && state_ != ConnectionState::AUTHENTICATED) {
        LOG_WARN("Attempted to send message on inactive connection to {}", remote_endpoint_);
        return;
    }
    
    write_queue_.push_back(PendingWrite{std::move(frame), std::move(on_sent)});
    
    if (!write_in_progress_) {
        do_write();
    }
}

void Connection::send_raw(MessageType type, std::span<const std::uint8_t> payload, WriteHandler on_sent) {
    send_frame(encode_frame(type, payload), std::move(on_sent));
}

void Connection::do_read_header() {
    if (state_ == ConnectionState::DISCONNECTED || state_ == ConnectionState::CLOSING) {
        return;
    }
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            last_activity_ = std::chrono::steady_clock::now();
            
            try {
                auto header = MessageHeader::deserialize(read_header_buffer_);
                if (!header.is_valid()) {
                    LOG_ERROR("Invalid message header from {}", remote_endpoint_);
                    close();
                    return;
                }
                
                if (header.payload_size > 0) {
                    do_read_payload(header);
                } else {
                    handle_message(header, {});
                    do_read_header();
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to parse message header from {}: {}", remote_endpoint_, e.what());
                close();
            }
        });
}

void Connection::do_read_payload(const MessageHeader& header) {
    read_payload_buffer_.resize(header.payload_size);
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self, header](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            last_activity_ = std::chrono::steady_clock::now();
            
            if (!header.verify_checksum(read_payload_buffer_)) {
                LOG_ERROR("Checksum mismatch for message from {}", remote_endpoint_);
                close();
                return;
            }
            
            try {
                handle_message(header, std::move(read_payload_buffer_));
                read_payload_buffer_.clear();
                do_read_header();
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to process message from {}: {}", remote_endpoint_, e.what());
                close();
            }
        });
}

void Connection::do_write() {
    if (write_queue_.empty() || write_in_progress_) {
        return;
    }
    
    write_in_progress_ = true;
    
    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(write_queue_.front().data),
        [this, self](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;
            
            if (ec) {
                handle_error(ec);
                return;
            }
            
            auto on_sent = std::move(write_queue_.front().on_sent);
            write_queue_.pop_front();
            
            if (on_sent) {
                on_sent();
            }
            do_write();
        });
}

void Connection::handle_message(const MessageHeader& header, std::vector<std::uint8_t> payload) {
    LOG_TRACE("Received message type {} ({} bytes) from {}", 
              static_cast<int>(header.type), payload.size(), remote_endpoint_);
    
    if (message_handler_) {
        message_handler_(header, std::move(payload));
    }
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_DEBUG("Connection to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Connection operation aborted for {}", remote_endpoint_);
    } else {
        LOG_WARN("Connection error with {}: {}", remote_endpoint_, error.message());
    }
    
    close();
}

BlockingConnection::BlockingConnection(std::chrono::milliseconds timeout)
    : io_context_()
    , socket_(io_context_)
    , timeout_(timeout) {
}

BlockingConnection::~BlockingConnection() {
    close();
}

void BlockingConnection::run_until_done(bool& done, const char* operation) {
    io_context_.restart();
    io_context_.run_for(timeout_);
    
    if (!done) {
        // Cancel the outstanding operation and let its handler run
        boost::system::error_code ec;
        socket_.close(ec);
        io_context_.restart();
        io_context_.run();
        throw TransferError(core::ErrorCode::Timeout,
                            std::string(operation) + " with " + remote_endpoint_ + " timed out after " +
                            std::to_string(timeout_.count()) + " ms");
    }
}

void BlockingConnection::connect(const tcp::endpoint& endpoint) {
    remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    
    bool done = false;
    boost::system::error_code result;
    socket_.async_connect(endpoint, [&](const boost::system::error_code& ec) {
        result = ec;
        done = true;
    });
    
    run_until_done(done, "connect");
    
    if (result) {
        boost::system::error_code ec;
        socket_.close(ec);
        throw TransferError(core::ErrorCode::TransportError,
                            "failed to connect to " + remote_endpoint_ + ": " + result.message());
    }
    
    socket_.set_option(tcp::no_delay(true), result);
    LOG_DEBUG("Connected to {}", remote_endpoint_);
}

void BlockingConnection::close() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void BlockingConnection::send_raw(MessageType type, std::span<const std::uint8_t> payload) {
    write(encode_frame(type, payload));
}

void BlockingConnection::write(const std::vector<std::uint8_t>& frame) {
    bool done = false;
    boost::system::error_code result;
    boost::asio::async_write(socket_, boost::asio::buffer(frame),
        [&](const boost::system::error_code& ec, std::size_t) {
            result = ec;
            done = true;
        });
    
    run_until_done(done, "write");
    
    if (result) {
        throw TransferError(core::ErrorCode::TransportError,
                            "failed to write to " + remote_endpoint_ + ": " + result.message());
    }
}

void BlockingConnection::read_exact(std::span<std::uint8_t> buffer) {
    bool done = false;
    boost::system::error_code result;
    boost::asio::async_read(socket_, boost::asio::buffer(buffer.data(), buffer.size()),
        [&](const boost::system::error_code& ec, std::size_t) {
            result = ec;
            done = true;
        });
    
    run_until_done(done, "read");
    
    if (result == boost::asio::error::eof) {
        throw TransferError(core::ErrorCode::TransportError,
                            "connection closed by " + remote_endpoint_);
    }
    if (result) {
        throw TransferError(core::ErrorCode::TransportError,
                            "failed to read from " + remote_endpoint_ + ": " + result.message());
    }
}

Frame BlockingConnection::receive() {
    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> header_buffer;
    read_exact(header_buffer);
    
    Frame frame;
    frame.header = MessageHeader::deserialize(header_buffer);
    if (!frame.header.is_valid()) {
        throw TransferError(core::ErrorCode::ProtocolError,
                            "invalid message header from " + remote_endpoint_);
    }
    
    frame.payload.resize(frame.header.payload_size);
    if (!frame.payload.empty()) {
        read_exact(frame.payload);
    }
    
    if (!frame.header.verify_checksum(frame.payload)) {
        throw TransferError(core::ErrorCode::ProtocolError,
                            "checksum mismatch for message from " + remote_endpoint_);
    }
    return frame;
}

}
