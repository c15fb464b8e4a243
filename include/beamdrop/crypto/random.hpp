#pragma once

#include "beamdrop/crypto/crypto_types.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace beamdrop::crypto {

class SecureRandom {
public:
    // Safe to call repeatedly and from several threads.
    static bool initialize();
    
    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    static std::vector<std::uint8_t> generate_bytes(size_t count);
    
    static std::uint32_t generate_uint32();
    static std::uint64_t generate_uint64();
};

}
