#pragma once

#include "beamdrop/crypto/identity.hpp"
#include "beamdrop/network/connection.hpp"
#include "beamdrop/network/ticket.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace beamdrop::network {

enum class RelayMode {
    Disabled,
    // No relay is advertised; the endpoint is reachable on its direct addresses
    Default,
    // Advertise relay_url and require it to be reachable before going online
    Custom
};

std::optional<RelayMode> parse_relay_mode(const std::string& name);
const char* to_string(RelayMode mode);

struct EndpointOptions {
    RelayMode relay_mode = RelayMode::Default;
    std::string relay_url;
    std::string bind_address = "0.0.0.0";
    // Protocols accepted from inbound peers; empty means dial-only
    std::vector<std::string> alpns;
    std::chrono::milliseconds io_timeout{30000};
};

class Endpoint {
public:
    // Throws TransferError(TransportError) if the listener cannot be bound.
    Endpoint(crypto::SecretKey secret_key, EndpointOptions options);
    ~Endpoint();
    
    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;
    
    const crypto::NodeId& node_id() const { return secret_key_.public_key(); }
    const crypto::SecretKey& secret_key() const { return secret_key_; }
    const EndpointOptions& options() const { return options_; }
    
    bool accepts(const std::string& alpn) const;
    bool is_listening() const { return acceptor_.is_open(); }
    std::uint16_t port() const;
    
    EndpointAddr addr() const;
    
    // Blocks until the endpoint is reachable. Throws TransferError(Timeout).
    void wait_online(std::chrono::milliseconds timeout) const;
    
    // Dials the direct addresses in order and authenticates the remote node id.
    std::unique_ptr<BlockingConnection> connect(const EndpointAddr& addr, const std::string& alpn) const;
    
    boost::asio::io_context& io_context() { return io_context_; }
    tcp::acceptor& acceptor() { return acceptor_; }
    
    void close();

private:
    crypto::SecretKey secret_key_;
    EndpointOptions options_;
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    
    void handshake(BlockingConnection& connection, const crypto::NodeId& expected,
                   const std::string& alpn) const;
};

// Local interface addresses suitable for advertising: non-loopback first,
// then 127.0.0.1.
std::vector<boost::asio::ip::address> local_addresses();

}
