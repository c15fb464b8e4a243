#pragma once

#include "beamdrop/crypto/crypto_types.hpp"
#include <span>
#include <string>

namespace beamdrop::crypto {

using NodeId = Ed25519PublicKey;

// Ephemeral endpoint identity. Secret material is wiped on destruction.
class SecretKey {
public:
    static SecretKey generate();
    
    SecretKey(const SecretKey& other) = default;
    SecretKey& operator=(const SecretKey& other) = default;
    ~SecretKey();
    
    const NodeId& public_key() const { return public_key_; }
    
    // Signs the handshake nonce bound to the negotiated protocol name.
    CryptoResult sign_proof(std::span<const std::uint8_t> nonce, const std::string& alpn,
                            Ed25519Signature& out_signature) const;

private:
    SecretKey() = default;
    
    NodeId public_key_{};
    Ed25519SecretKey secret_key_{};
};

// Checks that node_id signed (alpn, nonce) with sign_proof.
CryptoResult verify_proof(const NodeId& node_id, std::span<const std::uint8_t> nonce,
                          const std::string& alpn, const Ed25519Signature& signature);

std::string node_id_to_string(const NodeId& id);
std::string node_id_short(const NodeId& id);

}
