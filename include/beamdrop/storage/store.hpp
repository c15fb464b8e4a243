#pragma once

#include "beamdrop/crypto/crypto_types.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace beamdrop::storage {

using crypto::Hash;

enum class BlobFormat : std::uint8_t {
    Raw = 0,
    // Blob is a concatenation of 32-byte hashes; holding it holds every child.
    HashSeq = 1
};

struct HashAndFormat {
    Hash hash{};
    BlobFormat format = BlobFormat::Raw;
    
    bool operator==(const HashAndFormat& other) const = default;
    bool operator<(const HashAndFormat& other) const {
        return hash != other.hash ? hash < other.hash : format < other.format;
    }
};

enum class ImportMode {
    Copy,
    // Hash the file in place and serve it from its original location.
    TryReference
};

enum class ExportMode {
    Copy,
    // Hard-link store-owned data where the filesystem allows, copy otherwise.
    TryReference
};

// Reference-counted set of hashes protected from garbage collection.
class TempTagSet {
public:
    void acquire(const HashAndFormat& value);
    void release(const HashAndFormat& value);
    std::vector<HashAndFormat> snapshot() const;
    bool contains(const Hash& hash) const;

private:
    mutable std::mutex mutex_;
    std::map<HashAndFormat, std::size_t> counts_;
};

// Holds content in a store until released or destroyed.
class TempTag {
public:
    TempTag() = default;
    TempTag(std::shared_ptr<TempTagSet> owner, HashAndFormat value);
    ~TempTag();
    
    TempTag(const TempTag&) = delete;
    TempTag& operator=(const TempTag&) = delete;
    TempTag(TempTag&& other) noexcept;
    TempTag& operator=(TempTag&& other) noexcept;
    
    const Hash& hash() const { return value_.hash; }
    BlobFormat format() const { return value_.format; }
    const HashAndFormat& hash_and_format() const { return value_; }
    bool valid() const { return static_cast<bool>(owner_); }
    
    void release();

private:
    std::shared_ptr<TempTagSet> owner_;
    HashAndFormat value_;
};

struct AddSize { std::uint64_t size; };
struct AddDone { TempTag tag; };
struct AddError { std::string cause; };
using AddProgressItem = std::variant<AddSize, AddDone, AddError>;
using AddProgressHandler = std::function<void(AddProgressItem)>;

struct ExportSize { std::uint64_t size; };
struct ExportCopyProgress { std::uint64_t offset; };
struct ExportDone {};
struct ExportError { std::string cause; };
using ExportProgressItem = std::variant<ExportSize, ExportCopyProgress, ExportDone, ExportError>;
using BlobExportHandler = std::function<void(const ExportProgressItem&)>;

class BlobReader {
public:
    virtual ~BlobReader() = default;
    
    virtual std::uint64_t size() const = 0;
    // Returns the number of bytes read; 0 at end of blob.
    virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;
    virtual void seek(std::uint64_t offset) = 0;
};

// Append-only writer for a blob being fetched from a peer.
class PartialBlobWriter {
public:
    virtual ~PartialBlobWriter() = default;
    
    virtual const Hash& hash() const = 0;
    virtual std::uint64_t offset() const = 0;
    virtual void write(std::span<const std::uint8_t> data) = 0;
    // Verifies the content hash and publishes the blob. Throws on mismatch.
    virtual void complete() = 0;
    virtual void discard() = 0;
};

struct MissingBlob {
    Hash hash{};
    std::uint64_t local_offset = 0;
};

struct LocalInfo {
    HashAndFormat root;
    bool root_present = false;
    bool complete = false;
    // Bytes of child content already present, partial blobs included.
    std::uint64_t local_bytes = 0;
    std::vector<MissingBlob> missing;
};

// Content-addressed blob store consumed by the transfer core.
class Store {
public:
    virtual ~Store() = default;
    
    virtual void add_path(const std::filesystem::path& path, ImportMode mode,
                          BlobFormat format, const AddProgressHandler& progress) = 0;
    virtual TempTag add_bytes(std::span<const std::uint8_t> data, BlobFormat format) = 0;
    virtual void export_blob(const Hash& hash, const std::filesystem::path& target,
                             ExportMode mode, const BlobExportHandler& progress) = 0;
    
    virtual bool has(const Hash& hash) const = 0;
    virtual std::optional<std::uint64_t> size(const Hash& hash) const = 0;
    virtual std::unique_ptr<BlobReader> reader(const Hash& hash) const = 0;
    virtual std::vector<std::uint8_t> read_to_end(const Hash& hash, std::uint64_t max_size) const;
    
    virtual LocalInfo local(const HashAndFormat& root) const = 0;
    virtual std::unique_ptr<PartialBlobWriter> begin_partial(const Hash& hash) = 0;
    
    virtual TempTag temp_tag(const HashAndFormat& value) = 0;
    virtual std::size_t gc() = 0;
    virtual void shutdown() = 0;
};

// Splits a hash sequence blob into its child hashes.
std::vector<Hash> parse_hash_seq(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> encode_hash_seq(const std::vector<Hash>& hashes);

}
