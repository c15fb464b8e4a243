#include "beamdrop/network/endpoint.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/crypto/random.hpp"
#include <algorithm>
#include <thread>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace beamdrop::network {

using core::TransferError;

namespace {
    struct RelayTarget {
        std::string host;
        std::string port;
    };
    
    RelayTarget parse_relay_url(const std::string& url) {
        std::string rest = url;
        std::string port = "443";
        if (core::utils::StringUtils::starts_with(rest, "https://")) {
            rest = rest.substr(8);
        } else if (core::utils::StringUtils::starts_with(rest, "http://")) {
            rest = rest.substr(7);
            port = "80";
        }
        
        auto slash = rest.find('/');
        if (slash != std::string::npos) {
            rest = rest.substr(0, slash);
        }
        
        auto colon = rest.rfind(':');
        if (colon != std::string::npos && rest.find(']') == std::string::npos) {
            port = rest.substr(colon + 1);
            rest = rest.substr(0, colon);
        }
        if (rest.empty()) {
            throw TransferError(core::ErrorCode::TransportError, "relay url has no host: " + url);
        }
        return RelayTarget{rest, port};
    }
    
    bool probe(const RelayTarget& target, std::chrono::milliseconds timeout) {
        boost::asio::io_context io_context;
        tcp::resolver resolver(io_context);
        tcp::socket socket(io_context);
        
        bool connected = false;
        resolver.async_resolve(target.host, target.port,
            [&](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    return;
                }
                boost::asio::async_connect(socket, results,
                    [&](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
                        connected = !connect_ec;
                    });
            });
        
        io_context.run_for(timeout);
        return connected;
    }
}

std::optional<RelayMode> parse_relay_mode(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(core::utils::StringUtils::trim(name));
    if (lower == "disabled") return RelayMode::Disabled;
    if (lower == "default") return RelayMode::Default;
    if (lower == "custom") return RelayMode::Custom;
    return std::nullopt;
}

const char* to_string(RelayMode mode) {
    switch (mode) {
        case RelayMode::Disabled: return "disabled";
        case RelayMode::Default: return "default";
        case RelayMode::Custom: return "custom";
    }
    return "unknown";
}

std::vector<boost::asio::ip::address> local_addresses() {
    std::vector<boost::asio::ip::address> result;
    
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) == 0) {
        for (auto* entry = interfaces; entry != nullptr; entry = entry->ifa_next) {
            if (!entry->ifa_addr || !(entry->ifa_flags & IFF_UP) || (entry->ifa_flags & IFF_LOOPBACK)) {
                continue;
            }
            // IPv4 only; link-local IPv6 needs a scope id that tickets do not carry
            if (entry->ifa_addr->sa_family == AF_INET) {
                auto* in = reinterpret_cast<sockaddr_in*>(entry->ifa_addr);
                boost::asio::ip::address_v4 address(ntohl(in->sin_addr.s_addr));
                if (std::find(result.begin(), result.end(), address) == result.end()) {
                    result.emplace_back(address);
                }
            }
        }
        freeifaddrs(interfaces);
    } else {
        LOG_WARN("Failed to enumerate network interfaces");
    }
    
    result.emplace_back(boost::asio::ip::address_v4::loopback());
    return result;
}

Endpoint::Endpoint(crypto::SecretKey secret_key, EndpointOptions options)
    : secret_key_(std::move(secret_key))
    , options_(std::move(options))
    , io_context_()
    , acceptor_(io_context_) {
    
    if (options_.relay_mode == RelayMode::Custom && options_.relay_url.empty()) {
        throw TransferError(core::ErrorCode::TransportError, "custom relay mode requires a relay url");
    }
    
    if (!options_.alpns.empty()) {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(options_.bind_address, ec);
        if (ec) {
            throw TransferError(core::ErrorCode::TransportError,
                                "invalid bind address " + options_.bind_address);
        }
        
        tcp::endpoint endpoint(address, 0);
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor_.bind(endpoint, ec);
        if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            throw TransferError(core::ErrorCode::TransportError,
                                "failed to bind endpoint on " + options_.bind_address + ": " + ec.message());
        }
    }
    
    LOG_INFO("Endpoint {} bound (relay mode {}, port {})",
             crypto::node_id_short(node_id()), to_string(options_.relay_mode), port());
}

Endpoint::~Endpoint() {
    close();
}

bool Endpoint::accepts(const std::string& alpn) const {
    return std::find(options_.alpns.begin(), options_.alpns.end(), alpn) != options_.alpns.end();
}

std::uint16_t Endpoint::port() const {
    boost::system::error_code ec;
    auto local = acceptor_.local_endpoint(ec);
    return ec ? 0 : local.port();
}

EndpointAddr Endpoint::addr() const {
    EndpointAddr addr;
    addr.node_id = node_id();
    if (options_.relay_mode == RelayMode::Custom) {
        addr.relay_url = options_.relay_url;
    }
    
    auto listen_port = port();
    if (listen_port == 0) {
        return addr;
    }
    
    boost::system::error_code ec;
    auto bound = acceptor_.local_endpoint(ec).address();
    if (!ec && !bound.is_unspecified()) {
        addr.direct_addresses.emplace_back(bound, listen_port);
        return addr;
    }
    for (const auto& address : local_addresses()) {
        addr.direct_addresses.emplace_back(address, listen_port);
    }
    return addr;
}

void Endpoint::wait_online(std::chrono::milliseconds timeout) const {
    if (options_.relay_mode != RelayMode::Custom) {
        return;
    }
    
    auto target = parse_relay_url(options_.relay_url);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (probe(target, remaining)) {
            LOG_DEBUG("Relay {} reachable", options_.relay_url);
            return;
        }
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(250)));
    }
    
    throw TransferError(core::ErrorCode::Timeout,
                        "endpoint did not come online within " + std::to_string(timeout.count()) + " ms");
}

void Endpoint::handshake(BlockingConnection& connection, const crypto::NodeId& expected,
                         const std::string& alpn) const {
    HandshakeMessage hello;
    hello.alpn = alpn;
    hello.node_id = node_id();
    auto random = crypto::SecureRandom::generate_bytes(hello.nonce);
    if (!random) {
        throw TransferError(core::ErrorCode::TransportError, random.message);
    }
    
    connection.send_message(MessageType::HANDSHAKE, hello);
    auto frame = connection.receive();
    
    if (frame.header.type == MessageType::ERROR_RESPONSE) {
        auto error = ErrorMessage::deserialize(frame.payload);
        throw TransferError(core::ErrorCode::ProtocolError,
                            "peer rejected handshake: " + error.error_message);
    }
    if (frame.header.type != MessageType::HANDSHAKE_ACK) {
        throw TransferError(core::ErrorCode::ProtocolError,
                            "unexpected message " + std::to_string(static_cast<int>(frame.header.type)) +
                            " during handshake");
    }
    
    auto ack = HandshakeAckMessage::deserialize(frame.payload);
    if (ack.node_id != expected) {
        throw TransferError(core::ErrorCode::TransportError,
                            "peer identity mismatch: expected " + crypto::node_id_short(expected) +
                            ", got " + crypto::node_id_short(ack.node_id));
    }
    
    auto verified = crypto::verify_proof(expected, hello.nonce, alpn, ack.signature);
    if (!verified) {
        throw TransferError(core::ErrorCode::TransportError,
                            "peer " + crypto::node_id_short(expected) + " failed to prove its identity");
    }
}

std::unique_ptr<BlockingConnection> Endpoint::connect(const EndpointAddr& addr, const std::string& alpn) const {
    if (addr.direct_addresses.empty()) {
        throw TransferError(core::ErrorCode::TransportError,
                            "node " + crypto::node_id_short(addr.node_id) + " has no direct addresses");
    }
    
    std::string last_error;
    for (const auto& target : addr.direct_addresses) {
        auto connection = std::make_unique<BlockingConnection>(options_.io_timeout);
        try {
            connection->connect(target);
            handshake(*connection, addr.node_id, alpn);
            LOG_INFO("Connected to node {} at {}", crypto::node_id_short(addr.node_id),
                     connection->get_remote_endpoint());
            return connection;
        } catch (const TransferError& e) {
            LOG_DEBUG("Dial {}:{} failed: {}", target.address().to_string(), target.port(), e.what());
            last_error = e.what();
        }
    }
    
    throw TransferError(core::ErrorCode::TransportError,
                        "could not reach node " + crypto::node_id_short(addr.node_id) + ": " + last_error);
}

void Endpoint::close() {
    if (acceptor_.is_open()) {
        boost::system::error_code ec;
        acceptor_.close(ec);
    }
}

}
