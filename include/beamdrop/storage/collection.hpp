#pragma once

#include "beamdrop/storage/store.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace beamdrop::storage {

constexpr std::array<std::uint8_t, 8> COLLECTION_MAGIC = {'B', 'D', 'C', 'O', 'L', 'v', '1', '\0'};

// Ordered mapping of relative names to content hashes. Stored as a metadata
// blob holding the names plus a hash sequence [hash(metadata), hash(entry)...];
// the hash of the sequence identifies the collection.
class Collection {
public:
    using Entry = std::pair<std::string, Hash>;
    
    Collection() = default;
    explicit Collection(std::vector<Entry> entries);
    
    void push(std::string name, const Hash& hash);
    // Orders entries by name and rejects duplicates.
    void sort();
    
    const std::vector<Entry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const Entry& operator[](std::size_t index) const { return entries_[index]; }
    
    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }
    
    std::vector<std::uint8_t> encode_metadata() const;
    std::vector<Hash> hash_seq(const Hash& metadata_hash) const;
    
    // Writes metadata and hash sequence; the returned tag pins every entry.
    TempTag store(Store& store) const;
    
    // Throws TransferError(StoreError) on malformed or unsafe content.
    static Collection load(const Store& store, const Hash& root);
    static Collection decode(std::span<const std::uint8_t> metadata,
                             std::span<const Hash> entry_hashes);

private:
    std::vector<Entry> entries_;
};

}
