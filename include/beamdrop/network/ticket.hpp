#pragma once

#include "beamdrop/crypto/identity.hpp"
#include "beamdrop/storage/store.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <optional>
#include <string>
#include <vector>

namespace beamdrop::network {

using boost::asio::ip::tcp;

constexpr const char* TICKET_PREFIX = "blob";
constexpr std::uint8_t TICKET_VERSION = 1;

// Everything a peer needs to dial an endpoint.
struct EndpointAddr {
    crypto::NodeId node_id{};
    std::optional<std::string> relay_url;
    std::vector<tcp::endpoint> direct_addresses;
    
    bool operator==(const EndpointAddr& other) const = default;
};

class BlobTicket {
public:
    BlobTicket(EndpointAddr addr, const crypto::Hash& hash, storage::BlobFormat format);
    
    const EndpointAddr& addr() const { return addr_; }
    const crypto::Hash& hash() const { return hash_; }
    storage::BlobFormat format() const { return format_; }
    
    std::string to_string() const;
    
    // Throws TransferError(InvalidTicket) describing what is wrong.
    static BlobTicket parse(const std::string& text);
    
    bool operator==(const BlobTicket& other) const = default;

private:
    EndpointAddr addr_;
    crypto::Hash hash_;
    storage::BlobFormat format_;
    
    std::vector<std::uint8_t> encode() const;
};

}
