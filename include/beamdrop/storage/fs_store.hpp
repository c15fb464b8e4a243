#pragma once

#include "beamdrop/storage/blob_index.hpp"
#include "beamdrop/storage/storage_config.hpp"
#include "beamdrop/storage/store.hpp"
#include <atomic>
#include <memory>

namespace beamdrop::storage {

// Store backed by a directory: blob files fanned out under data/, in-flight
// downloads under partial/ and a SQLite catalogue beside them.
class FsStore : public Store {
public:
    // Throws TransferError(StoreError) if the directory cannot be prepared.
    explicit FsStore(const std::filesystem::path& directory);
    explicit FsStore(StorageConfig config);
    ~FsStore() override;
    
    FsStore(const FsStore&) = delete;
    FsStore& operator=(const FsStore&) = delete;
    
    void add_path(const std::filesystem::path& path, ImportMode mode,
                  BlobFormat format, const AddProgressHandler& progress) override;
    TempTag add_bytes(std::span<const std::uint8_t> data, BlobFormat format) override;
    void export_blob(const Hash& hash, const std::filesystem::path& target,
                     ExportMode mode, const BlobExportHandler& progress) override;
    
    bool has(const Hash& hash) const override;
    std::optional<std::uint64_t> size(const Hash& hash) const override;
    std::unique_ptr<BlobReader> reader(const Hash& hash) const override;
    
    LocalInfo local(const HashAndFormat& root) const override;
    std::unique_ptr<PartialBlobWriter> begin_partial(const Hash& hash) override;
    
    TempTag temp_tag(const HashAndFormat& value) override;
    std::size_t gc() override;
    void shutdown() override;
    
    const StorageConfig& config() const { return config_; }
    bool is_shut_down() const { return closed_.load(); }

private:
    StorageConfig config_;
    std::shared_ptr<BlobIndex> index_;
    std::shared_ptr<TempTagSet> tags_;
    std::atomic<bool> closed_{false};
    
    void ensure_open() const;
    std::filesystem::path blob_location(const BlobEntry& entry) const;
    std::filesystem::path make_staging_path() const;
    Hash copy_and_hash(const std::filesystem::path& source, const std::filesystem::path& staging) const;
    std::uint64_t partial_size(const std::string& hash_hex) const;
};

}
