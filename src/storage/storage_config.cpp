#include "beamdrop/storage/storage_config.hpp"

namespace beamdrop::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

bool StorageConfig::validate() const {
    if (data_directory.empty() || partial_directory.empty() || database_path.empty()) {
        return false;
    }
    
    if (io_buffer_size < 1024 || io_buffer_size > 16 * 1024 * 1024) {
        return false;
    }
    
    return export_progress_interval > 0;
}

bool StorageConfig::create_directories() const {
    std::error_code ec;
    std::filesystem::create_directories(data_directory, ec);
    if (ec) {
        return false;
    }
    std::filesystem::create_directories(partial_directory, ec);
    if (ec) {
        return false;
    }
    
    auto db_dir = database_path.parent_path();
    if (!db_dir.empty()) {
        std::filesystem::create_directories(db_dir, ec);
    }
    return !ec;
}

std::filesystem::path StorageConfig::get_blob_path(const std::string& hash_hex) const {
    // Fan out on the first byte of the hash to keep directories small
    return data_directory / hash_hex.substr(0, 2) / hash_hex;
}

std::filesystem::path StorageConfig::get_partial_path(const std::string& hash_hex) const {
    return partial_directory / (hash_hex + ".partial");
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    data_directory = base_dir / "data";
    partial_directory = base_dir / "partial";
    database_path = base_dir / "blobs.db";
}

}
