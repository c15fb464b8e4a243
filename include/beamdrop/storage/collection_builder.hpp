#pragma once

#include "beamdrop/storage/collection.hpp"
#include "beamdrop/storage/store.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace beamdrop::storage {

struct ImportRecord {
    std::string name;
    std::filesystem::path path;
    std::uint64_t size = 0;
};

struct ImportProgress {
    std::uint64_t total_files = 0;
    std::uint64_t done_files = 0;
    std::uint64_t total_size = 0;
    std::uint64_t done_size = 0;
};

using ImportProgressHandler = std::function<void(const ImportProgress&)>;

// Lists the direct children of a directory. A failure is reported through
// ec; entries returned alongside an error are ignored.
using DirectoryLister = std::function<std::vector<std::filesystem::directory_entry>(
    const std::filesystem::path& directory, std::error_code& ec)>;

std::vector<std::filesystem::directory_entry> list_directory(const std::filesystem::path& directory,
                                                             std::error_code& ec);

struct WalkPolicy {
    // Skip entries that cannot be enumerated instead of failing the import
    bool tolerate_entry_errors = true;
    // Empty means list_directory
    DirectoryLister lister;
};

struct WalkResult {
    std::vector<ImportRecord> records;
    std::size_t skipped_entries = 0;
};

struct ImportResult {
    TempTag tag;
    std::uint64_t total_size = 0;
    Collection collection;
    std::size_t skipped_entries = 0;
};

class CollectionBuilder {
public:
    explicit CollectionBuilder(WalkPolicy policy = {});
    
    // Stages every regular file below path into the store and publishes the
    // collection. The progress handler runs before each file is staged and
    // may throw to abort the import.
    ImportResult import(const std::filesystem::path& path, Store& store,
                        const ImportProgressHandler& progress) const;
    
    // Enumerates regular files below an existing canonical path. Names are
    // relative to the parent of root.
    WalkResult walk(const std::filesystem::path& root) const;
    
    const WalkPolicy& policy() const { return policy_; }

private:
    WalkPolicy policy_;
    
    void walk_directory(const std::filesystem::path& directory, const std::filesystem::path& base,
                        bool is_root, WalkResult& result) const;
    void skip_entry(const std::filesystem::path& path, const std::error_code& ec,
                    WalkResult& result) const;
};

}
