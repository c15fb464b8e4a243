#include "beamdrop/network/blob_server.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/crypto/hash.hpp"

namespace beamdrop::network {

using crypto::hash_utils::hash_to_hex;

BlobServer::BlobServer(Endpoint& endpoint, std::shared_ptr<storage::Store> store)
    : endpoint_(endpoint)
    , store_(std::move(store))
    , running_(false)
    , bytes_served_(0) {
}

BlobServer::~BlobServer() {
    stop();
    join();
}

bool BlobServer::start() {
    if (running_) {
        LOG_WARN("Blob server already running");
        return false;
    }
    if (!endpoint_.is_listening()) {
        LOG_ERROR("Blob server needs an endpoint that accepts connections");
        return false;
    }
    
    running_ = true;
    endpoint_.io_context().restart();
    do_accept();
    
    server_thread_ = std::thread([this]() {
        LOG_DEBUG("Blob server started on port {}", endpoint_.port());
        
        while (true) {
            try {
                endpoint_.io_context().run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Blob server IO error: {}", e.what());
                if (!running_) break;
            }
        }
        
        LOG_DEBUG("Blob server stopped");
    });
    
    return true;
}

void BlobServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    LOG_DEBUG("Stopping blob server on port {}", endpoint_.port());
    // Connections and the acceptor belong to the I/O thread
    boost::asio::post(endpoint_.io_context(), [this]() { shutdown_io(); });
}

void BlobServer::shutdown_io() {
    endpoint_.close();
    
    std::set<std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        connection->close();
    }
    
    endpoint_.io_context().stop();
}

void BlobServer::join() {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

std::size_t BlobServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void BlobServer::do_accept() {
    if (!running_) {
        return;
    }
    
    endpoint_.acceptor().async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                auto connection = std::make_shared<Connection>(std::move(socket));
                handle_new_connection(connection);
                do_accept();
            } else if (ec != boost::asio::error::operation_aborted && running_) {
                LOG_WARN("Accept error: {}", ec.message());
                do_accept();
            }
        });
}

void BlobServer::handle_new_connection(std::shared_ptr<Connection> connection) {
    LOG_INFO("Peer connected from {}", connection->get_remote_endpoint());
    
    std::weak_ptr<Connection> weak = connection;
    connection->set_message_handler(
        [this, weak](const MessageHeader& header, std::vector<std::uint8_t> payload) {
            if (auto conn = weak.lock()) {
                handle_message(conn, header, std::move(payload));
            }
        });
    
    connection->set_disconnect_handler(
        [this](std::shared_ptr<Connection> conn) {
            handle_connection_closed(conn);
        });
    
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.insert(connection);
    }
    
    connection->start();
}

void BlobServer::handle_connection_closed(std::shared_ptr<Connection> connection) {
    LOG_DEBUG("Peer disconnected: {}", connection->get_remote_endpoint());
    
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection);
}

void BlobServer::handle_message(std::shared_ptr<Connection> connection, const MessageHeader& header,
                                std::vector<std::uint8_t> payload) {
    try {
        if (header.type == MessageType::HANDSHAKE) {
            handle_handshake(connection, HandshakeMessage::deserialize(payload));
            return;
        }
        if (header.type == MessageType::DISCONNECT) {
            connection->close();
            return;
        }
        if (connection->get_state() != ConnectionState::AUTHENTICATED) {
            send_error(connection, ErrorCode::INVALID_MESSAGE, "handshake required", true);
            return;
        }
        
        switch (header.type) {
            case MessageType::GET_REQUEST:
                handle_get(connection, GetRequestMessage::deserialize(payload));
                break;
            case MessageType::SIZE_REQUEST:
                handle_size_request(connection, SizeRequestMessage::deserialize(payload));
                break;
            default:
                send_error(connection, ErrorCode::INVALID_MESSAGE,
                           "unexpected message type " + std::to_string(static_cast<int>(header.type)));
                break;
        }
    } catch (const core::TransferError& e) {
        LOG_WARN("Bad request from {}: {}", connection->get_remote_endpoint(), e.what());
        send_error(connection, ErrorCode::INVALID_MESSAGE, e.what(), true);
    }
}

void BlobServer::handle_handshake(std::shared_ptr<Connection> connection, const HandshakeMessage& msg) {
    if (!endpoint_.accepts(msg.alpn)) {
        LOG_WARN("Peer {} asked for unsupported protocol {}", connection->get_remote_endpoint(), msg.alpn);
        send_error(connection, ErrorCode::UNSUPPORTED_ALPN, "unsupported protocol " + msg.alpn, true);
        return;
    }
    
    HandshakeAckMessage ack;
    ack.node_id = endpoint_.node_id();
    auto signed_result = endpoint_.secret_key().sign_proof(msg.nonce, msg.alpn, ack.signature);
    if (!signed_result) {
        send_error(connection, ErrorCode::INTERNAL_ERROR, signed_result.message, true);
        return;
    }
    
    connection->set_state(ConnectionState::AUTHENTICATED);
    connection->send_message(MessageType::HANDSHAKE_ACK, ack);
    LOG_DEBUG("Handshake with node {} complete", crypto::node_id_short(msg.node_id));
}

void BlobServer::handle_get(std::shared_ptr<Connection> connection, const GetRequestMessage& msg) {
    std::shared_ptr<storage::BlobReader> reader;
    try {
        reader = store_->reader(msg.hash);
    } catch (const core::TransferError& e) {
        send_error(connection, ErrorCode::BLOB_NOT_FOUND, e.what());
        return;
    }
    
    if (msg.offset > reader->size()) {
        send_error(connection, ErrorCode::INVALID_OFFSET,
                   "offset " + std::to_string(msg.offset) + " beyond blob size " + std::to_string(reader->size()));
        return;
    }
    reader->seek(msg.offset);
    
    LOG_DEBUG("Serving blob {} from offset {} to {}", hash_to_hex(msg.hash), msg.offset,
              connection->get_remote_endpoint());
    
    BlobHeaderMessage header;
    header.hash = msg.hash;
    header.size = reader->size();
    header.offset = msg.offset;
    connection->send_message(MessageType::BLOB_HEADER, header);
    
    send_next_chunk(connection, reader, msg.hash);
}

void BlobServer::send_next_chunk(std::shared_ptr<Connection> connection,
                                 std::shared_ptr<storage::BlobReader> reader, const crypto::Hash& hash) {
    if (connection->get_state() != ConnectionState::AUTHENTICATED) {
        return;
    }
    
    BlobDataMessage chunk;
    chunk.data.resize(BLOB_CHUNK_SIZE);
    std::size_t n = 0;
    try {
        n = reader->read(chunk.data);
    } catch (const core::TransferError& e) {
        LOG_ERROR("Failed reading blob {}: {}", hash_to_hex(hash), e.what());
        send_error(connection, ErrorCode::INTERNAL_ERROR, e.what(), true);
        return;
    }
    
    if (n == 0) {
        connection->send_message(MessageType::BLOB_END, BlobEndMessage{hash});
        return;
    }
    
    chunk.data.resize(n);
    bytes_served_ += n;
    
    std::weak_ptr<Connection> weak = connection;
    connection->send_message(MessageType::BLOB_DATA, chunk, [this, weak, reader, hash]() {
        if (auto conn = weak.lock()) {
            send_next_chunk(conn, reader, hash);
        }
    });
}

void BlobServer::handle_size_request(std::shared_ptr<Connection> connection, const SizeRequestMessage& msg) {
    SizeResponseMessage response;
    response.sizes.reserve(msg.hashes.size());
    
    for (const auto& hash : msg.hashes) {
        auto size = store_->size(hash);
        if (!size) {
            send_error(connection, ErrorCode::BLOB_NOT_FOUND, "blob " + hash_to_hex(hash) + " not found");
            return;
        }
        response.sizes.push_back(*size);
    }
    
    connection->send_message(MessageType::SIZE_RESPONSE, response);
}

void BlobServer::send_error(std::shared_ptr<Connection> connection, ErrorCode code,
                            const std::string& message, bool close_after) {
    ErrorMessage error;
    error.error_code = static_cast<std::uint32_t>(code);
    error.error_message = message;
    
    std::weak_ptr<Connection> weak = connection;
    connection->send_message(MessageType::ERROR_RESPONSE, error, [weak, close_after]() {
        if (close_after) {
            if (auto conn = weak.lock()) {
                conn->close();
            }
        }
    });
}

}
