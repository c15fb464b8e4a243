#pragma once

#include "beamdrop/network/connection.hpp"
#include "beamdrop/storage/store.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace beamdrop::network {

struct HashSeqAndSizes {
    std::vector<crypto::Hash> hash_seq;
    std::vector<std::uint64_t> sizes;
    
    std::uint64_t total_size() const;
};

// Called with the number of bytes received so far during one get.
using GetProgressHandler = std::function<void(std::uint64_t offset)>;

// Fetches blobs over an authenticated connection into a store, verifying
// each blob's content hash before it becomes visible.
class BlobClient {
public:
    explicit BlobClient(BlockingConnection& connection);
    
    // Makes sure the hash sequence is local (fetching it if needed, up to
    // max_size bytes) and asks the peer for the size of every child.
    HashSeqAndSizes get_hash_seq_and_sizes(storage::Store& store, const crypto::Hash& root,
                                           std::uint64_t max_size);
    
    // Downloads the missing blobs, resuming partial ones. The handler may
    // throw to abort; the exception propagates unchanged.
    void execute_get(storage::Store& store, const std::vector<storage::MissingBlob>& missing,
                     const GetProgressHandler& progress);
    
    // Fetches a single blob; returns the number of bytes transferred.
    std::uint64_t fetch_blob(storage::Store& store, const crypto::Hash& hash,
                             std::uint64_t max_size, const GetProgressHandler& progress);
    
    void disconnect();

private:
    BlockingConnection& connection_;
    
    Frame expect(MessageType type);
};

}
