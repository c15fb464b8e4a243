#pragma once

#include "beamdrop/crypto/crypto_types.hpp"
#include <array>
#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace beamdrop::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x42445250; // "BDRP"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 10 * 1024 * 1024;
constexpr std::size_t BLOB_CHUNK_SIZE = 64 * 1024;

// Application protocol negotiated in the handshake
constexpr const char* BLOBS_ALPN = "/beamdrop/blobs/1";

enum class MessageType : std::uint8_t {
    HANDSHAKE       = 0x01,
    HANDSHAKE_ACK   = 0x02,
    DISCONNECT      = 0x04,

    GET_REQUEST     = 0x20,
    BLOB_HEADER     = 0x21,
    BLOB_DATA       = 0x22,
    BLOB_END        = 0x23,
    SIZE_REQUEST    = 0x24,
    SIZE_RESPONSE   = 0x25,

    ERROR_RESPONSE  = 0xFF
};

enum class MessageFlags : std::uint8_t {
    NONE            = 0x00
};

struct MessageHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    MessageType type;              // Message type
    MessageFlags flags;            // Message flags
    std::uint64_t message_id;      // Unique message ID
    std::uint32_t payload_size;    // Payload length in bytes
    std::uint64_t timestamp;       // Unix timestamp (nanoseconds)
    std::array<std::uint8_t, 4> checksum; // CRC32 of payload
    
    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);
    
    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;
    
    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
} __attribute__((packed));

static_assert(sizeof(MessageHeader) == MESSAGE_HEADER_SIZE);

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

std::uint32_t crc32(std::span<const std::uint8_t> data);

// Header plus payload, ready for the socket.
std::vector<std::uint8_t> encode_frame(MessageType type, std::span<const std::uint8_t> payload);

template<MessagePayload T>
std::vector<std::uint8_t> encode_frame(MessageType type, const T& message) {
    auto payload = message.serialize();
    return encode_frame(type, std::span<const std::uint8_t>(payload));
}

struct HandshakeMessage {
    std::string alpn;
    crypto::Ed25519PublicKey node_id{};
    crypto::Nonce nonce{};
    
    std::vector<std::uint8_t> serialize() const;
    static HandshakeMessage deserialize(std::span<const std::uint8_t> data);
};

struct HandshakeAckMessage {
    crypto::Ed25519PublicKey node_id{};
    // Handshake proof (see SecretKey::sign_proof) from the responder's node key
    crypto::Ed25519Signature signature{};
    
    std::vector<std::uint8_t> serialize() const;
    static HandshakeAckMessage deserialize(std::span<const std::uint8_t> data);
};

struct GetRequestMessage {
    crypto::Hash hash{};
    std::uint64_t offset = 0;
    
    std::vector<std::uint8_t> serialize() const;
    static GetRequestMessage deserialize(std::span<const std::uint8_t> data);
};

struct BlobHeaderMessage {
    crypto::Hash hash{};
    std::uint64_t size = 0;
    std::uint64_t offset = 0;
    
    std::vector<std::uint8_t> serialize() const;
    static BlobHeaderMessage deserialize(std::span<const std::uint8_t> data);
};

struct BlobDataMessage {
    std::vector<std::uint8_t> data;
    
    std::vector<std::uint8_t> serialize() const;
    static BlobDataMessage deserialize(std::span<const std::uint8_t> data);
};

struct BlobEndMessage {
    crypto::Hash hash{};
    
    std::vector<std::uint8_t> serialize() const;
    static BlobEndMessage deserialize(std::span<const std::uint8_t> data);
};

struct SizeRequestMessage {
    std::vector<crypto::Hash> hashes;
    
    std::vector<std::uint8_t> serialize() const;
    static SizeRequestMessage deserialize(std::span<const std::uint8_t> data);
};

struct SizeResponseMessage {
    std::vector<std::uint64_t> sizes;
    
    std::vector<std::uint8_t> serialize() const;
    static SizeResponseMessage deserialize(std::span<const std::uint8_t> data);
};

struct ErrorMessage {
    std::uint32_t error_code = 0;
    std::string error_message;
    
    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

enum class ErrorCode : std::uint32_t {
    NONE                    = 0,
    PROTOCOL_VERSION        = 1,
    INVALID_MESSAGE         = 2,
    UNSUPPORTED_ALPN        = 3,
    BLOB_NOT_FOUND          = 4,
    INVALID_OFFSET          = 5,
    INTERNAL_ERROR          = 99
};

}

static_assert(beamdrop::network::MessagePayload<beamdrop::network::HandshakeMessage>);
static_assert(beamdrop::network::MessagePayload<beamdrop::network::GetRequestMessage>);
static_assert(beamdrop::network::MessagePayload<beamdrop::network::BlobDataMessage>);
