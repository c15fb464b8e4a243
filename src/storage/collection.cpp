#include "beamdrop/storage/collection.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/wire.hpp"
#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/storage/path_codec.hpp"
#include <algorithm>

namespace beamdrop::storage {

using core::ErrorCode;
using core::TransferError;

namespace {

constexpr std::uint64_t MAX_METADATA_SIZE = 64 * 1024 * 1024;

}

Collection::Collection(std::vector<Entry> entries)
    : entries_(std::move(entries)) {
}

void Collection::push(std::string name, const Hash& hash) {
    entries_.emplace_back(std::move(name), hash);
}

void Collection::sort() {
    std::sort(entries_.begin(), entries_.end(),
              [](const Entry& a, const Entry& b) { return a.first < b.first; });
    
    auto duplicate = std::adjacent_find(entries_.begin(), entries_.end(),
                                        [](const Entry& a, const Entry& b) { return a.first == b.first; });
    if (duplicate != entries_.end()) {
        throw TransferError(ErrorCode::ImportError, "duplicate name in collection: " + duplicate->first);
    }
}

std::vector<std::uint8_t> Collection::encode_metadata() const {
    std::vector<std::uint8_t> buffer(COLLECTION_MAGIC.begin(), COLLECTION_MAGIC.end());
    core::wire::write_uint32(buffer, static_cast<std::uint32_t>(entries_.size()));
    for (const auto& [name, _] : entries_) {
        core::wire::write_string(buffer, name);
    }
    return buffer;
}

std::vector<Hash> Collection::hash_seq(const Hash& metadata_hash) const {
    std::vector<Hash> hashes;
    hashes.reserve(entries_.size() + 1);
    hashes.push_back(metadata_hash);
    for (const auto& [_, hash] : entries_) {
        hashes.push_back(hash);
    }
    return hashes;
}

TempTag Collection::store(Store& store) const {
    auto metadata = encode_metadata();
    auto metadata_tag = store.add_bytes(metadata, BlobFormat::Raw);
    auto seq = encode_hash_seq(hash_seq(metadata_tag.hash()));
    // The hash sequence tag protects the metadata blob from here on
    return store.add_bytes(seq, BlobFormat::HashSeq);
}

Collection Collection::load(const Store& store, const Hash& root) {
    auto root_size = store.size(root);
    if (!root_size) {
        throw TransferError(ErrorCode::NotFound,
                            "collection " + crypto::hash_utils::hash_to_hex(root) + " not found");
    }
    
    auto hashes = parse_hash_seq(store.read_to_end(root, *root_size));
    if (hashes.empty()) {
        throw TransferError(ErrorCode::StoreError, "collection hash sequence is empty");
    }
    
    auto metadata = store.read_to_end(hashes.front(), MAX_METADATA_SIZE);
    return decode(metadata, std::span<const Hash>(hashes).subspan(1));
}

Collection Collection::decode(std::span<const std::uint8_t> metadata,
                              std::span<const Hash> entry_hashes) {
    if (metadata.size() < COLLECTION_MAGIC.size() ||
        !std::equal(COLLECTION_MAGIC.begin(), COLLECTION_MAGIC.end(), metadata.begin())) {
        throw TransferError(ErrorCode::StoreError, "collection metadata has a bad magic");
    }
    
    auto data = metadata.subspan(COLLECTION_MAGIC.size());
    std::vector<Entry> entries;
    try {
        auto count = core::wire::read_uint32(data);
        if (count != entry_hashes.size()) {
            throw TransferError(ErrorCode::StoreError,
                                "collection names " + std::to_string(count) +
                                " do not match " + std::to_string(entry_hashes.size()) + " hashes");
        }
        
        entries.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            auto name = core::wire::read_string(data);
            if (!path_codec::is_valid_name(name)) {
                throw TransferError(ErrorCode::StoreError, "collection contains unsafe name: " + name);
            }
            entries.emplace_back(std::move(name), entry_hashes[i]);
        }
    } catch (const TransferError& e) {
        if (e.code() == ErrorCode::ProtocolError) {
            throw TransferError(ErrorCode::StoreError, std::string("truncated collection metadata: ") + e.what());
        }
        throw;
    }
    
    if (!data.empty()) {
        throw TransferError(ErrorCode::StoreError, "trailing bytes after collection metadata");
    }
    
    return Collection(std::move(entries));
}

}
