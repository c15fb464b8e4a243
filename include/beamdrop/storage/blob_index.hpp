#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace beamdrop::storage {

struct BlobEntry {
    std::string hash_hex;
    std::uint64_t size = 0;
    // Referenced blobs are served from a file the store does not own
    bool external = false;
    std::filesystem::path external_path;
    std::int64_t created_at = 0;
};

// SQLite catalogue of complete blobs. All methods are thread safe.
class BlobIndex {
public:
    explicit BlobIndex(const std::filesystem::path& db_path);
    ~BlobIndex();
    
    BlobIndex(const BlobIndex&) = delete;
    BlobIndex& operator=(const BlobIndex&) = delete;
    
    bool initialize();
    
    bool put(const BlobEntry& entry);
    
    bool remove(const std::string& hash_hex);
    
    std::optional<BlobEntry> get(const std::string& hash_hex) const;
    
    bool contains(const std::string& hash_hex) const;
    
    std::vector<BlobEntry> list() const;
    
    size_t count() const;
    
    std::uint64_t total_size() const;
    
    void close();
    
    bool is_open() const;

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;
    
    bool create_tables();
};

}
