#include "beamdrop/crypto/identity.hpp"
#include "beamdrop/crypto/random.hpp"
#include "beamdrop/core/utils.hpp"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace beamdrop::crypto {

namespace {
    // Length-prefixed so (a, bc) and (ab, c) never collide
    std::vector<std::uint8_t> proof_message(std::span<const std::uint8_t> nonce, const std::string& alpn) {
        std::vector<std::uint8_t> message;
        message.reserve(4 + alpn.size() + nonce.size());
        
        auto alpn_len = static_cast<std::uint32_t>(alpn.size());
        message.push_back((alpn_len >> 24) & 0xFF);
        message.push_back((alpn_len >> 16) & 0xFF);
        message.push_back((alpn_len >> 8) & 0xFF);
        message.push_back(alpn_len & 0xFF);
        message.insert(message.end(), alpn.begin(), alpn.end());
        message.insert(message.end(), nonce.begin(), nonce.end());
        return message;
    }
}

SecretKey SecretKey::generate() {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    
    SecretKey key;
    if (crypto_sign_keypair(key.public_key_.data(), key.secret_key_.data()) != 0) {
        throw std::runtime_error("Failed to generate Ed25519 keypair");
    }
    return key;
}

SecretKey::~SecretKey() {
    sodium_memzero(secret_key_.data(), secret_key_.size());
}

CryptoResult SecretKey::sign_proof(std::span<const std::uint8_t> nonce, const std::string& alpn,
                                   Ed25519Signature& out_signature) const {
    if (nonce.empty()) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, "Handshake nonce is empty");
    }
    
    auto message = proof_message(nonce, alpn);
    unsigned long long signature_len = 0;
    if (crypto_sign_detached(out_signature.data(), &signature_len, message.data(), message.size(),
                             secret_key_.data()) != 0 ||
        signature_len != ED25519_SIGNATURE_SIZE) {
        return CryptoResult(CryptoError::INVALID_SIGNATURE, "Failed to sign handshake proof");
    }
    return CryptoResult();
}

CryptoResult verify_proof(const NodeId& node_id, std::span<const std::uint8_t> nonce,
                          const std::string& alpn, const Ed25519Signature& signature) {
    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "libsodium not initialized");
    }
    
    auto message = proof_message(nonce, alpn);
    if (crypto_sign_verify_detached(signature.data(), message.data(), message.size(), node_id.data()) != 0) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Handshake proof verification failed");
    }
    return CryptoResult();
}

std::string node_id_to_string(const NodeId& id) {
    return core::utils::EncodingUtils::to_hex(id);
}

std::string node_id_short(const NodeId& id) {
    return node_id_to_string(id).substr(0, 10);
}

}
