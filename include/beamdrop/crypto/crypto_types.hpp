#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace beamdrop::crypto {

constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64; // libsodium layout: seed || public key
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

constexpr size_t HASH_SIZE = 32;
constexpr size_t NONCE_SIZE = 32;

using Ed25519PublicKey = std::array<std::uint8_t, ED25519_PUBLIC_KEY_SIZE>;
using Ed25519SecretKey = std::array<std::uint8_t, ED25519_SECRET_KEY_SIZE>;
using Ed25519Signature = std::array<std::uint8_t, ED25519_SIGNATURE_SIZE>;

// BLAKE2b-256 content identifier
using Hash = std::array<std::uint8_t, HASH_SIZE>;
using Nonce = std::array<std::uint8_t, NONCE_SIZE>;

enum class CryptoError {
    SUCCESS = 0,
    NOT_INITIALIZED,
    INVALID_SIGNATURE,
    BUFFER_TOO_SMALL,
    VERIFICATION_FAILED,
    RANDOM_GENERATION_FAILED,
    FILE_READ_ERROR
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
