#include "beamdrop/storage/collection_builder.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/storage/path_codec.hpp"
#include <optional>
#include <type_traits>
#include <variant>

namespace beamdrop::storage {

using core::ErrorCode;
using core::ItemError;
using core::TransferError;

std::vector<std::filesystem::directory_entry> list_directory(const std::filesystem::path& directory,
                                                             std::error_code& ec) {
    std::vector<std::filesystem::directory_entry> entries;
    std::filesystem::directory_iterator it(directory, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        entries.push_back(*it);
    }
    return entries;
}

CollectionBuilder::CollectionBuilder(WalkPolicy policy)
    : policy_(std::move(policy)) {
}

void CollectionBuilder::skip_entry(const std::filesystem::path& path, const std::error_code& ec,
                                   WalkResult& result) const {
    if (!policy_.tolerate_entry_errors) {
        throw TransferError(ErrorCode::WalkError,
                            "cannot read " + path.string() + ": " + ec.message());
    }
    LOG_WARN("Skipping unreadable entry {}: {}", path.string(), ec.message());
    result.skipped_entries++;
}

void CollectionBuilder::walk_directory(const std::filesystem::path& directory,
                                       const std::filesystem::path& base,
                                       bool is_root, WalkResult& result) const {
    std::error_code ec;
    auto entries = policy_.lister ? policy_.lister(directory, ec) : list_directory(directory, ec);
    if (ec) {
        if (is_root) {
            throw TransferError(ErrorCode::WalkError,
                                "cannot read directory " + directory.string() + ": " + ec.message());
        }
        skip_entry(directory, ec, result);
        return;
    }
    
    for (const auto& entry : entries) {
        auto status = entry.symlink_status(ec);
        if (ec) {
            skip_entry(entry.path(), ec, result);
            ec.clear();
            continue;
        }
        
        if (std::filesystem::is_directory(status)) {
            walk_directory(entry.path(), base, false, result);
        } else if (std::filesystem::is_regular_file(status)) {
            ImportRecord record;
            record.path = entry.path();
            record.name = path_codec::encode(entry.path().lexically_relative(base), true);
            record.size = entry.file_size(ec);
            if (ec) {
                record.size = 0;
                ec.clear();
            }
            result.records.push_back(std::move(record));
        }
        // Symlinks, sockets and devices are not part of a collection
    }
}

WalkResult CollectionBuilder::walk(const std::filesystem::path& root) const {
    WalkResult result;
    auto base = root.parent_path();
    
    std::error_code ec;
    auto status = std::filesystem::status(root, ec);
    if (ec) {
        throw TransferError(ErrorCode::WalkError, "cannot stat " + root.string() + ": " + ec.message());
    }
    
    if (std::filesystem::is_regular_file(status)) {
        ImportRecord record;
        record.path = root;
        record.name = path_codec::encode(root.lexically_relative(base), true);
        record.size = std::filesystem::file_size(root, ec);
        if (ec) {
            record.size = 0;
        }
        result.records.push_back(std::move(record));
    } else if (std::filesystem::is_directory(status)) {
        walk_directory(root, base, true, result);
    }
    
    return result;
}

ImportResult CollectionBuilder::import(const std::filesystem::path& path, Store& store,
                                       const ImportProgressHandler& progress) const {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        throw TransferError(ErrorCode::NotFound, "path " + path.string() + " does not exist");
    }
    
    auto walked = walk(canonical);
    
    ImportProgress state;
    state.total_files = walked.records.size();
    for (const auto& record : walked.records) {
        state.total_size += record.size;
    }
    
    LOG_INFO("Importing {} files ({} bytes) from {}", state.total_files, state.total_size, canonical.string());
    
    ImportResult result;
    result.skipped_entries = walked.skipped_entries;
    
    // Entry tags keep content alive until the collection tag takes over
    std::vector<TempTag> entry_tags;
    entry_tags.reserve(walked.records.size());
    
    for (const auto& record : walked.records) {
        progress(state);
        
        std::optional<TempTag> tag;
        std::optional<std::string> error;
        std::uint64_t size = 0;
        
        store.add_path(record.path, ImportMode::TryReference, BlobFormat::Raw,
                       [&](AddProgressItem item) {
            std::visit([&](auto&& event) {
                using T = std::decay_t<decltype(event)>;
                if constexpr (std::is_same_v<T, AddSize>) {
                    size = event.size;
                } else if constexpr (std::is_same_v<T, AddDone>) {
                    tag = std::move(event.tag);
                } else {
                    error = event.cause;
                }
            }, item);
        });
        
        if (error) {
            throw ItemError(ErrorCode::ImportError, record.name, *error);
        }
        if (!tag) {
            throw ItemError(ErrorCode::ImportError, record.name, "store finished without a result");
        }
        
        result.collection.push(record.name, tag->hash());
        result.total_size += size;
        entry_tags.push_back(std::move(*tag));
        
        state.done_files++;
        state.done_size += size;
    }
    
    result.collection.sort();
    result.tag = result.collection.store(store);
    
    LOG_INFO("Imported collection {} with {} entries",
             crypto::hash_utils::hash_to_hex(result.tag.hash()), result.collection.size());
    return result;
}

}
