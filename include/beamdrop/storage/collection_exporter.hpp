#pragma once

#include "beamdrop/storage/collection.hpp"
#include "beamdrop/storage/store.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>

namespace beamdrop::storage {

struct ExportProgress {
    std::uint64_t total_files = 0;
    std::uint64_t done_files = 0;
};

using ExportProgressHandler = std::function<void(const ExportProgress&)>;

class CollectionExporter {
public:
    explicit CollectionExporter(ExportMode mode = ExportMode::Copy);
    
    // Writes every entry below output_root, refusing to replace existing
    // files. An empty output_root means the current working directory.
    // Throws ItemError(ExportError) naming the entry that failed.
    void export_collection(Store& store, const Collection& collection,
                           const std::filesystem::path& output_root,
                           const ExportProgressHandler& progress) const;

private:
    ExportMode mode_;
    
    void export_entry(Store& store, const std::string& name, const Hash& hash,
                      const std::filesystem::path& target) const;
};

}
