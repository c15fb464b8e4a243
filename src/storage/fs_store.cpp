#include "beamdrop/storage/fs_store.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/crypto/random.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <set>
#include <vector>

namespace beamdrop::storage {

using core::ErrorCode;
using core::TransferError;
using crypto::hash_utils::hash_to_hex;

namespace {

class FileBlobReader : public BlobReader {
public:
    FileBlobReader(const std::filesystem::path& path, std::uint64_t size)
        : file_(path, std::ios::binary)
        , size_(size)
        , position_(0) {
        if (!file_.is_open()) {
            throw TransferError(ErrorCode::StoreError, "cannot open blob file " + path.string());
        }
    }
    
    std::uint64_t size() const override { return size_; }
    
    std::size_t read(std::span<std::uint8_t> buffer) override {
        auto remaining = size_ - position_;
        auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
        if (wanted == 0) {
            return 0;
        }
        
        file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
        auto got = static_cast<std::size_t>(file_.gcount());
        if (got == 0) {
            throw TransferError(ErrorCode::StoreError, "blob file is shorter than recorded");
        }
        position_ += got;
        return got;
    }
    
    void seek(std::uint64_t offset) override {
        if (offset > size_) {
            throw TransferError(ErrorCode::StoreError, "seek beyond end of blob");
        }
        file_.clear();
        file_.seekg(static_cast<std::streamoff>(offset));
        position_ = offset;
    }

private:
    std::ifstream file_;
    std::uint64_t size_;
    std::uint64_t position_;
};

class FsPartialWriter : public PartialBlobWriter {
public:
    FsPartialWriter(const StorageConfig& config, std::shared_ptr<BlobIndex> index, const Hash& hash)
        : config_(config)
        , index_(std::move(index))
        , hash_(hash)
        , hash_hex_(hash_to_hex(hash))
        , path_(config.get_partial_path(hash_hex_))
        , offset_(0)
        , finished_(false) {
        std::error_code ec;
        auto existing = std::filesystem::file_size(path_, ec);
        if (!ec) {
            offset_ = existing;
        }
        file_.open(path_, std::ios::binary | std::ios::app);
        if (!file_.is_open()) {
            throw TransferError(ErrorCode::StoreError, "cannot open partial blob " + path_.string());
        }
    }
    
    ~FsPartialWriter() override {
        // An abandoned download stays on disk so the next attempt resumes it
        if (file_.is_open()) {
            file_.close();
        }
    }
    
    const Hash& hash() const override { return hash_; }
    std::uint64_t offset() const override { return offset_; }
    
    void write(std::span<const std::uint8_t> data) override {
        if (finished_) {
            throw TransferError(ErrorCode::StoreError, "write to a finished partial blob");
        }
        file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file_) {
            throw TransferError(ErrorCode::StoreError, "failed writing partial blob " + hash_hex_);
        }
        offset_ += data.size();
    }
    
    void complete() override {
        if (finished_) {
            return;
        }
        file_.close();
        finished_ = true;
        
        Hash actual;
        auto result = crypto::ContentHasher::hash_file(path_, actual);
        if (!result) {
            throw TransferError(ErrorCode::StoreError, result.message);
        }
        if (actual != hash_) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            throw TransferError(ErrorCode::StoreError,
                                "content hash mismatch for blob " + hash_hex_);
        }
        
        auto target = config_.get_blob_path(hash_hex_);
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        std::filesystem::rename(path_, target, ec);
        if (ec) {
            throw TransferError(ErrorCode::StoreError,
                                "cannot publish blob " + hash_hex_ + ": " + ec.message());
        }
        
        BlobEntry entry;
        entry.hash_hex = hash_hex_;
        entry.size = offset_;
        if (!index_->put(entry)) {
            throw TransferError(ErrorCode::StoreError, "cannot record blob " + hash_hex_);
        }
        LOG_DEBUG("Stored downloaded blob {} ({} bytes)", hash_hex_, offset_);
    }
    
    void discard() override {
        if (file_.is_open()) {
            file_.close();
        }
        finished_ = true;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

private:
    StorageConfig config_;
    std::shared_ptr<BlobIndex> index_;
    Hash hash_;
    std::string hash_hex_;
    std::filesystem::path path_;
    std::ofstream file_;
    std::uint64_t offset_;
    bool finished_;
};

struct FileCloser {
    void operator()(std::FILE* file) const {
        if (file) {
            std::fclose(file);
        }
    }
};

}

FsStore::FsStore(const std::filesystem::path& directory)
    : FsStore(StorageConfig(directory)) {
}

FsStore::FsStore(StorageConfig config)
    : config_(std::move(config))
    , tags_(std::make_shared<TempTagSet>()) {
    if (!config_.validate()) {
        throw TransferError(ErrorCode::StoreError, "invalid store configuration");
    }
    if (!config_.create_directories()) {
        throw TransferError(ErrorCode::StoreError,
                            "cannot create store directories under " + config_.data_directory.parent_path().string());
    }
    
    index_ = std::make_shared<BlobIndex>(config_.database_path);
    if (!index_->initialize()) {
        throw TransferError(ErrorCode::StoreError,
                            "cannot open blob index " + config_.database_path.string());
    }
    
    LOG_DEBUG("Opened blob store at {}", config_.database_path.parent_path().string());
}

FsStore::~FsStore() {
    shutdown();
}

void FsStore::ensure_open() const {
    if (closed_.load()) {
        throw TransferError(ErrorCode::StoreError, "store is shut down");
    }
}

std::filesystem::path FsStore::blob_location(const BlobEntry& entry) const {
    return entry.external ? entry.external_path : config_.get_blob_path(entry.hash_hex);
}

std::filesystem::path FsStore::make_staging_path() const {
    auto suffix = core::utils::EncodingUtils::to_hex(crypto::SecureRandom::generate_bytes(8));
    return config_.partial_directory / ("import-" + suffix + ".tmp");
}

Hash FsStore::copy_and_hash(const std::filesystem::path& source,
                            const std::filesystem::path& staging) const {
    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        throw TransferError(ErrorCode::StoreError, "cannot open " + source.string());
    }
    std::ofstream output(staging, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw TransferError(ErrorCode::StoreError, "cannot create " + staging.string());
    }
    
    crypto::ContentHasher hasher;
    auto result = hasher.initialize();
    if (!result) {
        throw TransferError(ErrorCode::StoreError, result.message);
    }
    
    std::vector<std::uint8_t> buffer(config_.io_buffer_size);
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(input.gcount());
        if (got == 0) {
            break;
        }
        result = hasher.update(std::span<const std::uint8_t>(buffer.data(), got));
        if (!result) {
            throw TransferError(ErrorCode::StoreError, result.message);
        }
        output.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(got));
        if (!output) {
            throw TransferError(ErrorCode::StoreError, "failed writing " + staging.string());
        }
    }
    if (input.bad()) {
        throw TransferError(ErrorCode::StoreError, "failed reading " + source.string());
    }
    
    output.close();
    if (!output) {
        throw TransferError(ErrorCode::StoreError, "failed closing " + staging.string());
    }
    return hasher.finalize();
}

void FsStore::add_path(const std::filesystem::path& path, ImportMode mode,
                       BlobFormat format, const AddProgressHandler& progress) {
    std::uint64_t file_size = 0;
    try {
        ensure_open();
        file_size = std::filesystem::file_size(path);
    } catch (const std::exception& e) {
        progress(AddError{e.what()});
        return;
    }
    
    progress(AddSize{file_size});
    
    std::optional<Hash> hash;
    std::string cause;
    std::filesystem::path staging;
    try {
        BlobEntry entry;
        entry.size = file_size;
        
        if (mode == ImportMode::TryReference) {
            Hash computed;
            auto result = crypto::ContentHasher::hash_file(path, computed);
            if (!result) {
                throw TransferError(ErrorCode::StoreError, result.message);
            }
            entry.hash_hex = hash_to_hex(computed);
            entry.external = true;
            entry.external_path = std::filesystem::absolute(path);
            hash = computed;
        } else {
            staging = make_staging_path();
            auto computed = copy_and_hash(path, staging);
            entry.hash_hex = hash_to_hex(computed);
            entry.size = std::filesystem::file_size(staging);
            
            auto target = config_.get_blob_path(entry.hash_hex);
            std::filesystem::create_directories(target.parent_path());
            std::filesystem::rename(staging, target);
            staging.clear();
            hash = computed;
        }
        
        // Identical content already catalogued keeps its existing entry
        if (!index_->contains(entry.hash_hex) && !index_->put(entry)) {
            throw TransferError(ErrorCode::StoreError, "cannot record blob " + entry.hash_hex);
        }
        LOG_TRACE("Imported {} as blob {}", path.string(), entry.hash_hex);
    } catch (const std::exception& e) {
        cause = e.what();
        hash.reset();
    }
    
    if (!staging.empty()) {
        std::error_code ec;
        std::filesystem::remove(staging, ec);
    }
    
    if (!hash) {
        progress(AddError{cause});
        return;
    }
    progress(AddDone{TempTag(tags_, HashAndFormat{*hash, format})});
}

TempTag FsStore::add_bytes(std::span<const std::uint8_t> data, BlobFormat format) {
    ensure_open();
    
    auto hash = crypto::ContentHasher::hash(data);
    auto hash_hex = hash_to_hex(hash);
    
    // Tag first so a concurrent gc cannot collect the blob before it is catalogued
    TempTag tag(tags_, HashAndFormat{hash, format});
    if (index_->contains(hash_hex)) {
        return tag;
    }
    
    auto staging = make_staging_path();
    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        output.close();
        if (!output) {
            std::error_code ec;
            std::filesystem::remove(staging, ec);
            throw TransferError(ErrorCode::StoreError, "failed writing blob " + hash_hex);
        }
    }
    
    auto target = config_.get_blob_path(hash_hex);
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        throw TransferError(ErrorCode::StoreError, "cannot store blob " + hash_hex);
    }
    
    BlobEntry entry;
    entry.hash_hex = hash_hex;
    entry.size = data.size();
    if (!index_->put(entry)) {
        throw TransferError(ErrorCode::StoreError, "cannot record blob " + hash_hex);
    }
    return tag;
}

void FsStore::export_blob(const Hash& hash, const std::filesystem::path& target,
                          ExportMode mode, const BlobExportHandler& progress) {
    std::optional<BlobEntry> entry;
    try {
        ensure_open();
        entry = index_->get(hash_to_hex(hash));
    } catch (const std::exception& e) {
        progress(ExportError{e.what()});
        return;
    }
    if (!entry) {
        progress(ExportError{"blob " + hash_to_hex(hash) + " not found"});
        return;
    }
    
    // ExportSize is reported once the target exists and belongs to this export
    auto source = blob_location(*entry);
    
    if (mode == ExportMode::TryReference && !entry->external) {
        std::error_code ec;
        std::filesystem::create_hard_link(source, target, ec);
        if (!ec) {
            progress(ExportSize{entry->size});
            progress(ExportDone{});
            return;
        }
        if (ec == std::errc::file_exists) {
            progress(ExportError{"destination " + target.string() + " already exists"});
            return;
        }
        LOG_DEBUG("Hard link to {} failed ({}), copying instead", target.string(), ec.message());
    }
    
    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        progress(ExportError{"cannot open blob file " + source.string()});
        return;
    }
    
    // "x" refuses to replace an existing file
    std::unique_ptr<std::FILE, FileCloser> output(std::fopen(target.c_str(), "wbx"));
    if (!output) {
        auto error = errno;
        progress(ExportError{error == EEXIST
            ? "destination " + target.string() + " already exists"
            : "cannot create " + target.string() + ": " + std::strerror(error)});
        return;
    }
    
    progress(ExportSize{entry->size});
    
    std::vector<std::uint8_t> buffer(config_.io_buffer_size);
    std::uint64_t copied = 0;
    std::uint64_t next_report = config_.export_progress_interval;
    std::string failure;
    while (copied < entry->size) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(input.gcount());
        if (got == 0) {
            failure = "blob file " + source.string() + " is shorter than recorded";
            break;
        }
        if (std::fwrite(buffer.data(), 1, got, output.get()) != got) {
            failure = "failed writing " + target.string() + ": " + std::strerror(errno);
            break;
        }
        copied += got;
        if (copied >= next_report) {
            progress(ExportCopyProgress{copied});
            next_report = copied + config_.export_progress_interval;
        }
    }
    
    if (failure.empty() && std::fclose(output.release()) != 0) {
        failure = "failed closing " + target.string();
    }
    if (!failure.empty()) {
        output.reset();
        std::error_code ec;
        std::filesystem::remove(target, ec);
        progress(ExportError{failure});
        return;
    }
    
    progress(ExportDone{});
}

bool FsStore::has(const Hash& hash) const {
    ensure_open();
    return index_->contains(hash_to_hex(hash));
}

std::optional<std::uint64_t> FsStore::size(const Hash& hash) const {
    ensure_open();
    auto entry = index_->get(hash_to_hex(hash));
    if (!entry) {
        return std::nullopt;
    }
    return entry->size;
}

std::unique_ptr<BlobReader> FsStore::reader(const Hash& hash) const {
    ensure_open();
    auto entry = index_->get(hash_to_hex(hash));
    if (!entry) {
        throw TransferError(ErrorCode::NotFound, "blob " + hash_to_hex(hash) + " not found");
    }
    
    auto location = blob_location(*entry);
    if (entry->external) {
        std::error_code ec;
        auto current = std::filesystem::file_size(location, ec);
        if (ec || current != entry->size) {
            throw TransferError(ErrorCode::StoreError,
                                "referenced file " + location.string() + " changed after import");
        }
    }
    return std::make_unique<FileBlobReader>(location, entry->size);
}

std::uint64_t FsStore::partial_size(const std::string& hash_hex) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(config_.get_partial_path(hash_hex), ec);
    return ec ? 0 : size;
}

LocalInfo FsStore::local(const HashAndFormat& root) const {
    ensure_open();
    
    LocalInfo info;
    info.root = root;
    
    auto root_hex = hash_to_hex(root.hash);
    auto root_entry = index_->get(root_hex);
    if (!root_entry) {
        auto offset = partial_size(root_hex);
        info.missing.push_back(MissingBlob{root.hash, offset});
        if (root.format == BlobFormat::Raw) {
            info.local_bytes = offset;
        }
        return info;
    }
    
    info.root_present = true;
    if (root.format == BlobFormat::Raw) {
        info.local_bytes = root_entry->size;
        info.complete = true;
        return info;
    }
    
    auto children = parse_hash_seq(read_to_end(root.hash, root_entry->size));
    for (const auto& child : children) {
        auto child_hex = hash_to_hex(child);
        if (auto entry = index_->get(child_hex)) {
            info.local_bytes += entry->size;
            continue;
        }
        auto offset = partial_size(child_hex);
        info.local_bytes += offset;
        info.missing.push_back(MissingBlob{child, offset});
    }
    info.complete = info.missing.empty();
    return info;
}

std::unique_ptr<PartialBlobWriter> FsStore::begin_partial(const Hash& hash) {
    ensure_open();
    return std::make_unique<FsPartialWriter>(config_, index_, hash);
}

TempTag FsStore::temp_tag(const HashAndFormat& value) {
    ensure_open();
    return TempTag(tags_, value);
}

std::size_t FsStore::gc() {
    ensure_open();
    
    std::set<std::string> live;
    for (const auto& tagged : tags_->snapshot()) {
        live.insert(hash_to_hex(tagged.hash));
        if (tagged.format != BlobFormat::HashSeq) {
            continue;
        }
        try {
            auto root_size = size(tagged.hash);
            if (!root_size) {
                continue;
            }
            for (const auto& child : parse_hash_seq(read_to_end(tagged.hash, *root_size))) {
                live.insert(hash_to_hex(child));
            }
        } catch (const std::exception& e) {
            LOG_WARN("Cannot read hash sequence {} during gc: {}", hash_to_hex(tagged.hash), e.what());
        }
    }
    
    std::size_t removed = 0;
    for (const auto& entry : index_->list()) {
        if (live.count(entry.hash_hex)) {
            continue;
        }
        if (!entry.external) {
            std::error_code ec;
            std::filesystem::remove(config_.get_blob_path(entry.hash_hex), ec);
            if (ec) {
                LOG_WARN("Failed to delete blob file {}: {}", entry.hash_hex, ec.message());
                continue;
            }
        }
        if (index_->remove(entry.hash_hex)) {
            ++removed;
        }
    }
    
    if (removed > 0) {
        LOG_DEBUG("Garbage collected {} blobs", removed);
    }
    return removed;
}

void FsStore::shutdown() {
    if (closed_.exchange(true)) {
        return;
    }
    if (index_) {
        index_->close();
    }
    LOG_DEBUG("Blob store shut down");
}

}
