#include "beamdrop/crypto/random.hpp"
#include "beamdrop/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace beamdrop::crypto {

bool SecureRandom::initialize() {
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    return true;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

std::vector<std::uint8_t> SecureRandom::generate_bytes(size_t count) {
    std::vector<std::uint8_t> result(count);
    auto crypto_result = generate_bytes(std::span(result));
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + crypto_result.message);
    }
    return result;
}

std::uint32_t SecureRandom::generate_uint32() {
    initialize();
    return randombytes_random();
}

std::uint64_t SecureRandom::generate_uint64() {
    initialize();
    std::uint64_t high = randombytes_random();
    std::uint64_t low = randombytes_random();
    return (high << 32) | low;
}

}
