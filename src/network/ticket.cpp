#include "beamdrop/network/ticket.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/core/wire.hpp"

namespace beamdrop::network {

using core::ErrorCode;
using core::TransferError;
using namespace core::wire;

namespace {
    constexpr std::uint8_t FAMILY_V4 = 4;
    constexpr std::uint8_t FAMILY_V6 = 6;
    
    void write_endpoint(std::vector<std::uint8_t>& buffer, const tcp::endpoint& endpoint) {
        auto address = endpoint.address();
        if (address.is_v4()) {
            write_uint8(buffer, FAMILY_V4);
            auto bytes = address.to_v4().to_bytes();
            write_bytes(buffer, bytes);
        } else {
            write_uint8(buffer, FAMILY_V6);
            auto bytes = address.to_v6().to_bytes();
            write_bytes(buffer, bytes);
        }
        write_uint16(buffer, endpoint.port());
    }
    
    tcp::endpoint read_endpoint(std::span<const std::uint8_t>& data) {
        auto family = read_uint8(data);
        boost::asio::ip::address address;
        if (family == FAMILY_V4) {
            address = boost::asio::ip::address_v4(read_array<4>(data));
        } else if (family == FAMILY_V6) {
            address = boost::asio::ip::address_v6(read_array<16>(data));
        } else {
            throw TransferError(ErrorCode::InvalidTicket,
                                "unknown address family " + std::to_string(family));
        }
        auto port = read_uint16(data);
        return tcp::endpoint(address, port);
    }
}

BlobTicket::BlobTicket(EndpointAddr addr, const crypto::Hash& hash, storage::BlobFormat format)
    : addr_(std::move(addr))
    , hash_(hash)
    , format_(format) {
}

std::vector<std::uint8_t> BlobTicket::encode() const {
    std::vector<std::uint8_t> buffer;
    write_uint8(buffer, TICKET_VERSION);
    write_bytes(buffer, addr_.node_id);
    
    write_uint8(buffer, addr_.relay_url ? 1 : 0);
    if (addr_.relay_url) {
        write_string(buffer, *addr_.relay_url);
    }
    
    write_uint16(buffer, static_cast<std::uint16_t>(addr_.direct_addresses.size()));
    for (const auto& endpoint : addr_.direct_addresses) {
        write_endpoint(buffer, endpoint);
    }
    
    write_bytes(buffer, hash_);
    write_uint8(buffer, static_cast<std::uint8_t>(format_));
    return buffer;
}

std::string BlobTicket::to_string() const {
    return TICKET_PREFIX + core::utils::EncodingUtils::to_base32(encode());
}

BlobTicket BlobTicket::parse(const std::string& text) {
    if (!core::utils::StringUtils::starts_with(text, TICKET_PREFIX)) {
        throw TransferError(ErrorCode::InvalidTicket, "ticket does not start with \"blob\"");
    }
    
    auto decoded = core::utils::EncodingUtils::from_base32(text.substr(std::string(TICKET_PREFIX).size()));
    if (!decoded) {
        throw TransferError(ErrorCode::InvalidTicket, "ticket is not valid base32");
    }
    
    std::span<const std::uint8_t> data(*decoded);
    try {
        auto version = read_uint8(data);
        if (version != TICKET_VERSION) {
            throw TransferError(ErrorCode::InvalidTicket,
                                "unsupported ticket version " + std::to_string(version));
        }
        
        EndpointAddr addr;
        addr.node_id = read_array<crypto::ED25519_PUBLIC_KEY_SIZE>(data);
        
        auto has_relay = read_uint8(data);
        if (has_relay > 1) {
            throw TransferError(ErrorCode::InvalidTicket, "malformed relay flag");
        }
        if (has_relay) {
            addr.relay_url = read_string(data, 2048);
        }
        
        auto count = read_uint16(data);
        addr.direct_addresses.reserve(count);
        for (std::uint16_t i = 0; i < count; ++i) {
            addr.direct_addresses.push_back(read_endpoint(data));
        }
        
        auto hash = read_array<crypto::HASH_SIZE>(data);
        auto format = read_uint8(data);
        if (format > static_cast<std::uint8_t>(storage::BlobFormat::HashSeq)) {
            throw TransferError(ErrorCode::InvalidTicket, "unknown blob format " + std::to_string(format));
        }
        
        if (!data.empty()) {
            throw TransferError(ErrorCode::InvalidTicket, "trailing data after ticket");
        }
        
        return BlobTicket(std::move(addr), hash, static_cast<storage::BlobFormat>(format));
    } catch (const TransferError& e) {
        if (e.code() == ErrorCode::InvalidTicket) {
            throw;
        }
        throw TransferError(ErrorCode::InvalidTicket, std::string("truncated ticket: ") + e.what());
    }
}

}
