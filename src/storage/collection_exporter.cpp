#include "beamdrop/storage/collection_exporter.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/storage/path_codec.hpp"
#include <optional>
#include <variant>

namespace beamdrop::storage {

using core::ErrorCode;
using core::ItemError;
using core::TransferError;

CollectionExporter::CollectionExporter(ExportMode mode)
    : mode_(mode) {
}

void CollectionExporter::export_entry(Store& store, const std::string& name, const Hash& hash,
                                      const std::filesystem::path& target) const {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw ItemError(ErrorCode::ExportError, name,
                        "cannot create " + target.parent_path().string() + ": " + ec.message());
    }
    
    std::optional<std::string> error;
    bool created = false;
    store.export_blob(hash, target, mode_, [&](const ExportProgressItem& item) {
        if (const auto* failed = std::get_if<ExportError>(&item)) {
            error = failed->cause;
        } else if (std::holds_alternative<ExportSize>(item)) {
            created = true;
        }
    });
    
    if (!error) {
        return;
    }
    
    // Only remove what this export wrote, never a file that was already there
    if (created && std::filesystem::exists(target, ec)) {
        std::filesystem::remove(target, ec);
        if (ec) {
            LOG_WARN("Failed to remove partial export {}: {}", target.string(), ec.message());
        }
    }
    throw ItemError(ErrorCode::ExportError, name, *error);
}

void CollectionExporter::export_collection(Store& store, const Collection& collection,
                                           const std::filesystem::path& output_root,
                                           const ExportProgressHandler& progress) const {
    auto root = output_root;
    if (root.empty()) {
        root = std::filesystem::current_path();
    }
    
    ExportProgress state;
    state.total_files = collection.size();
    
    for (const auto& [name, hash] : collection) {
        progress(state);
        
        auto target = path_codec::decode(root, name);
        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::symlink_status(target, ec))) {
            throw TransferError(ErrorCode::DestinationExists,
                                "target " + target.string() + " already exists");
        }
        
        export_entry(store, name, hash, target);
        LOG_DEBUG("Exported {} to {}", name, target.string());
        state.done_files++;
    }
    
    LOG_INFO("Exported {} files to {}", collection.size(), root.string());
}

}
