#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/core/utils.hpp"
#include <sodium.h>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace beamdrop::crypto {

struct ContentHasher::Impl {
    crypto_generichash_state state;
};

ContentHasher::ContentHasher() 
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

ContentHasher::~ContentHasher() = default;

CryptoResult ContentHasher::initialize() {
    if (crypto_generichash_init(&impl_->state, nullptr, 0, HASH_SIZE) != 0) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Failed to initialize content hasher");
    }
    
    initialized_ = true;
    return CryptoResult();
}

CryptoResult ContentHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Hasher not initialized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Failed to update hash");
    }
    
    return CryptoResult();
}

CryptoResult ContentHasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Hasher not initialized");
    }
    
    if (output.size() < HASH_SIZE) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer too small");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), HASH_SIZE) != 0) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

Hash ContentHasher::finalize() {
    Hash result;
    auto crypto_result = finalize(std::span(result));
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to finalize hash: " + crypto_result.message);
    }
    return result;
}

Hash ContentHasher::hash(std::span<const std::uint8_t> data) {
    Hash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

CryptoResult ContentHasher::hash_file(const std::filesystem::path& file_path, Hash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::FILE_READ_ERROR, "Cannot open file for hashing: " + file_path.string());
    }
    
    ContentHasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }
    
    constexpr size_t buffer_size = 65536; // 64KB buffer
    std::vector<std::uint8_t> buffer(buffer_size);
    
    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());
        
        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }
    
    if (file.bad()) {
        return CryptoResult(CryptoError::FILE_READ_ERROR, "Read error while hashing: " + file_path.string());
    }
    
    return hasher.finalize(std::span(output));
}

namespace hash_utils {

Hash hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return ContentHasher::hash(data);
}

bool verify_hash(std::span<const std::uint8_t> data, const Hash& expected_hash) {
    auto computed_hash = ContentHasher::hash(data);
    return sodium_memcmp(computed_hash.data(), expected_hash.data(), HASH_SIZE) == 0;
}

std::string hash_to_hex(const Hash& hash) {
    return core::utils::EncodingUtils::to_hex(hash);
}

std::optional<Hash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != HASH_SIZE * 2) {
        return std::nullopt;
    }
    
    auto bytes = core::utils::EncodingUtils::from_hex(hex_string);
    if (!bytes) {
        return std::nullopt;
    }
    
    Hash hash;
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

Hash empty_hash() {
    return ContentHasher::hash({});
}

}

}
