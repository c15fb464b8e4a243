#include <gtest/gtest.h>
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/network/ticket.hpp"

using namespace beamdrop::network;
using beamdrop::core::ErrorCode;
using beamdrop::core::TransferError;
using beamdrop::storage::BlobFormat;

namespace {

EndpointAddr sample_addr() {
    EndpointAddr addr;
    addr.node_id.fill(0xA5);
    addr.relay_url = "tcp://relay.example.net:3340";
    addr.direct_addresses.emplace_back(boost::asio::ip::make_address("192.168.1.20"), 41000);
    addr.direct_addresses.emplace_back(boost::asio::ip::make_address("fe80::1"), 41001);
    return addr;
}

void expect_invalid(const std::string& text) {
    try {
        BlobTicket::parse(text);
        ADD_FAILURE() << "accepted " << text;
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidTicket) << text;
    }
}

}

TEST(TicketTest, RoundTrip) {
    auto hash = beamdrop::crypto::hash_utils::hash_string("collection");
    BlobTicket ticket(sample_addr(), hash, BlobFormat::HashSeq);
    
    auto text = ticket.to_string();
    EXPECT_EQ(text.rfind("blob", 0), 0u);
    
    auto parsed = BlobTicket::parse(text);
    EXPECT_EQ(parsed, ticket);
    EXPECT_EQ(parsed.format(), BlobFormat::HashSeq);
    ASSERT_EQ(parsed.addr().direct_addresses.size(), 2u);
    EXPECT_EQ(parsed.addr().direct_addresses[1].port(), 41001);
}

TEST(TicketTest, WithoutRelayOrAddresses) {
    EndpointAddr addr;
    addr.node_id.fill(0x01);
    BlobTicket ticket(addr, beamdrop::crypto::hash_utils::empty_hash(), BlobFormat::Raw);
    
    auto parsed = BlobTicket::parse(ticket.to_string());
    EXPECT_FALSE(parsed.addr().relay_url.has_value());
    EXPECT_TRUE(parsed.addr().direct_addresses.empty());
    EXPECT_EQ(parsed.format(), BlobFormat::Raw);
}

TEST(TicketTest, RejectsMalformedText) {
    expect_invalid("");
    expect_invalid("hello");
    expect_invalid("blob");
    expect_invalid("blob!!!!");
    expect_invalid("nodeabcdefgh");
}

TEST(TicketTest, RejectsTruncatedAndPaddedPayload) {
    BlobTicket ticket(sample_addr(), beamdrop::crypto::hash_utils::hash_string("x"), BlobFormat::HashSeq);
    auto text = ticket.to_string();
    
    expect_invalid(text.substr(0, text.size() / 2));
    
    auto body = beamdrop::core::utils::EncodingUtils::from_base32(text.substr(4));
    ASSERT_TRUE(body.has_value());
    body->push_back(0);
    expect_invalid("blob" + beamdrop::core::utils::EncodingUtils::to_base32(*body));
}

TEST(TicketTest, RejectsUnknownVersionAndFormat) {
    BlobTicket ticket(sample_addr(), beamdrop::crypto::hash_utils::hash_string("x"), BlobFormat::Raw);
    auto body = *beamdrop::core::utils::EncodingUtils::from_base32(ticket.to_string().substr(4));
    
    auto bad_version = body;
    bad_version[0] = 9;
    expect_invalid("blob" + beamdrop::core::utils::EncodingUtils::to_base32(bad_version));
    
    auto bad_format = body;
    bad_format.back() = 7;
    expect_invalid("blob" + beamdrop::core::utils::EncodingUtils::to_base32(bad_format));
}
