#include "beamdrop/network/protocol.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/wire.hpp"
#include "beamdrop/crypto/random.hpp"
#include <algorithm>
#include <chrono>

namespace beamdrop::network {

using namespace core::wire;

namespace {
    constexpr std::array<std::uint32_t, 256> make_crc_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? 0xEDB88320 ^ (c >> 1) : c >> 1;
            }
            table[i] = c;
        }
        return table;
    }
    
    constexpr auto CRC_TABLE = make_crc_table();
    
    static_assert(CRC_TABLE[1] == 0x77073096);
    static_assert(CRC_TABLE[255] == 0x2D02EF8D);
    
    std::uint64_t generate_message_id() {
        return crypto::SecureRandom::generate_uint64();
    }
    
    std::uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()).count();
    }
    
    void expect_consumed(std::span<const std::uint8_t> rest, const char* what) {
        if (!rest.empty()) {
            throw core::TransferError(core::ErrorCode::ProtocolError,
                                      std::string("Trailing bytes in ") + what);
        }
    }
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = CRC_TABLE[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

MessageHeader::MessageHeader() 
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::DISCONNECT)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(0)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(payload_len)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION && payload_size <= MAX_PAYLOAD_SIZE;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto expected_crc = crc32(payload);
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                     (static_cast<std::uint32_t>(checksum[1]) << 16) |
                     (static_cast<std::uint32_t>(checksum[2]) << 8) |
                     static_cast<std::uint32_t>(checksum[3]);
    return expected_crc == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);
    
    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(static_cast<std::uint8_t>(flags));
    write_uint64(buffer, message_id);
    write_uint32(buffer, payload_size);
    write_uint64(buffer, timestamp);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());
    
    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw core::TransferError(core::ErrorCode::ProtocolError, "Insufficient data for message header");
    }
    
    MessageHeader header;
    auto span = data;
    
    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(read_uint8(span));
    header.flags = static_cast<MessageFlags>(read_uint8(span));
    header.message_id = read_uint64(span);
    header.payload_size = read_uint32(span);
    header.timestamp = read_uint64(span);
    header.checksum = read_array<4>(span);
    
    return header;
}

std::vector<std::uint8_t> encode_frame(MessageType type, std::span<const std::uint8_t> payload) {
    MessageHeader header(type, static_cast<std::uint32_t>(payload.size()));
    header.calculate_checksum(payload);
    
    auto frame = header.serialize();
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::vector<std::uint8_t> HandshakeMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, alpn);
    write_bytes(buffer, node_id);
    write_bytes(buffer, nonce);
    return buffer;
}

HandshakeMessage HandshakeMessage::deserialize(std::span<const std::uint8_t> data) {
    HandshakeMessage msg;
    auto span = data;
    msg.alpn = read_string(span, 256);
    msg.node_id = read_array<crypto::ED25519_PUBLIC_KEY_SIZE>(span);
    msg.nonce = read_array<crypto::NONCE_SIZE>(span);
    expect_consumed(span, "handshake");
    return msg;
}

std::vector<std::uint8_t> HandshakeAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_bytes(buffer, node_id);
    write_bytes(buffer, signature);
    return buffer;
}

HandshakeAckMessage HandshakeAckMessage::deserialize(std::span<const std::uint8_t> data) {
    HandshakeAckMessage msg;
    auto span = data;
    msg.node_id = read_array<crypto::ED25519_PUBLIC_KEY_SIZE>(span);
    msg.signature = read_array<crypto::ED25519_SIGNATURE_SIZE>(span);
    expect_consumed(span, "handshake ack");
    return msg;
}

std::vector<std::uint8_t> GetRequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_bytes(buffer, hash);
    write_uint64(buffer, offset);
    return buffer;
}

GetRequestMessage GetRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    GetRequestMessage msg;
    auto span = data;
    msg.hash = read_array<crypto::HASH_SIZE>(span);
    msg.offset = read_uint64(span);
    expect_consumed(span, "get request");
    return msg;
}

std::vector<std::uint8_t> BlobHeaderMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_bytes(buffer, hash);
    write_uint64(buffer, size);
    write_uint64(buffer, offset);
    return buffer;
}

BlobHeaderMessage BlobHeaderMessage::deserialize(std::span<const std::uint8_t> data) {
    BlobHeaderMessage msg;
    auto span = data;
    msg.hash = read_array<crypto::HASH_SIZE>(span);
    msg.size = read_uint64(span);
    msg.offset = read_uint64(span);
    expect_consumed(span, "blob header");
    return msg;
}

std::vector<std::uint8_t> BlobDataMessage::serialize() const {
    return data;
}

BlobDataMessage BlobDataMessage::deserialize(std::span<const std::uint8_t> data) {
    BlobDataMessage msg;
    msg.data.assign(data.begin(), data.end());
    return msg;
}

std::vector<std::uint8_t> BlobEndMessage::serialize() const {
    return std::vector<std::uint8_t>(hash.begin(), hash.end());
}

BlobEndMessage BlobEndMessage::deserialize(std::span<const std::uint8_t> data) {
    BlobEndMessage msg;
    auto span = data;
    msg.hash = read_array<crypto::HASH_SIZE>(span);
    expect_consumed(span, "blob end");
    return msg;
}

std::vector<std::uint8_t> SizeRequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, static_cast<std::uint32_t>(hashes.size()));
    for (const auto& hash : hashes) {
        write_bytes(buffer, hash);
    }
    return buffer;
}

SizeRequestMessage SizeRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    SizeRequestMessage msg;
    auto span = data;
    auto count = read_uint32(span);
    if (count > span.size() / crypto::HASH_SIZE) {
        throw core::TransferError(core::ErrorCode::ProtocolError, "Size request count exceeds payload");
    }
    msg.hashes.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        msg.hashes.push_back(read_array<crypto::HASH_SIZE>(span));
    }
    expect_consumed(span, "size request");
    return msg;
}

std::vector<std::uint8_t> SizeResponseMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, static_cast<std::uint32_t>(sizes.size()));
    for (auto size : sizes) {
        write_uint64(buffer, size);
    }
    return buffer;
}

SizeResponseMessage SizeResponseMessage::deserialize(std::span<const std::uint8_t> data) {
    SizeResponseMessage msg;
    auto span = data;
    auto count = read_uint32(span);
    if (count > span.size() / sizeof(std::uint64_t)) {
        throw core::TransferError(core::ErrorCode::ProtocolError, "Size response count exceeds payload");
    }
    msg.sizes.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        msg.sizes.push_back(read_uint64(span));
    }
    expect_consumed(span, "size response");
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, error_code);
    write_string(buffer, error_message);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    auto span = data;
    msg.error_code = read_uint32(span);
    msg.error_message = read_string(span);
    return msg;
}

}
