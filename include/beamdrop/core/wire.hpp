#pragma once

#include "beamdrop/core/error.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

// Big-endian primitives shared by the wire protocol, tickets and collection
// metadata. Readers consume from the front of the span and throw
// TransferError(ProtocolError) when the input is too short.
namespace beamdrop::core::wire {

void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value);
void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value);
void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value);
void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value);
void write_string(std::vector<std::uint8_t>& buffer, const std::string& str);
void write_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> bytes);

std::uint8_t read_uint8(std::span<const std::uint8_t>& data);
std::uint16_t read_uint16(std::span<const std::uint8_t>& data);
std::uint32_t read_uint32(std::span<const std::uint8_t>& data);
std::uint64_t read_uint64(std::span<const std::uint8_t>& data);
std::string read_string(std::span<const std::uint8_t>& data, std::size_t max_length = 1 << 20);

template<std::size_t N>
std::array<std::uint8_t, N> read_array(std::span<const std::uint8_t>& data) {
    if (data.size() < N) {
        throw TransferError(ErrorCode::ProtocolError,
                            "Insufficient data for " + std::to_string(N) + "-byte field");
    }
    std::array<std::uint8_t, N> value;
    std::copy_n(data.begin(), N, value.begin());
    data = data.subspan(N);
    return value;
}

}
