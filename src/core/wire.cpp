#include "beamdrop/core/wire.hpp"
#include "beamdrop/core/error.hpp"

namespace beamdrop::core::wire {

namespace {

void require(const std::span<const std::uint8_t>& data, std::size_t count, const char* what) {
    if (data.size() < count) {
        throw TransferError(ErrorCode::ProtocolError, std::string("Insufficient data for ") + what);
    }
}

}

void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
    buffer.push_back(value);
}

void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back(value & 0xFF);
}

void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    buffer.push_back((value >> 24) & 0xFF);
    buffer.push_back((value >> 16) & 0xFF);
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back(value & 0xFF);
}

void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
    write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
    write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
}

void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
    write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
    buffer.insert(buffer.end(), str.begin(), str.end());
}

void write_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
    require(data, 1, "uint8");
    auto value = data[0];
    data = data.subspan(1);
    return value;
}

std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
    require(data, 2, "uint16");
    std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                          static_cast<std::uint16_t>(data[1]);
    data = data.subspan(2);
    return value;
}

std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
    require(data, 4, "uint32");
    std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                          (static_cast<std::uint32_t>(data[1]) << 16) |
                          (static_cast<std::uint32_t>(data[2]) << 8) |
                          static_cast<std::uint32_t>(data[3]);
    data = data.subspan(4);
    return value;
}

std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
    auto high = read_uint32(data);
    auto low = read_uint32(data);
    return (static_cast<std::uint64_t>(high) << 32) | low;
}

std::string read_string(std::span<const std::uint8_t>& data, std::size_t max_length) {
    auto length = read_uint32(data);
    if (length > max_length) {
        throw TransferError(ErrorCode::ProtocolError,
                            "String length " + std::to_string(length) + " exceeds limit");
    }
    require(data, length, "string");
    std::string str(reinterpret_cast<const char*>(data.data()), length);
    data = data.subspan(length);
    return str;
}

}
