#pragma once

#include "beamdrop/crypto/crypto_types.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace beamdrop::crypto {

// Incremental BLAKE2b-256 hasher used for every content identifier.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();
    
    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;
    
    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(std::span<std::uint8_t> output);
    Hash finalize();
    
    static Hash hash(std::span<const std::uint8_t> data);
    static CryptoResult hash_file(const std::filesystem::path& file_path, Hash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

Hash hash_string(const std::string& str);
bool verify_hash(std::span<const std::uint8_t> data, const Hash& expected_hash);
std::string hash_to_hex(const Hash& hash);
std::optional<Hash> hash_from_hex(const std::string& hex_string);
Hash empty_hash();

}

}
