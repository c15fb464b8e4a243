#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace beamdrop::storage {

struct StorageConfig {
    std::filesystem::path data_directory;
    std::filesystem::path partial_directory;
    std::filesystem::path database_path;
    
    std::uint32_t io_buffer_size = 65536; // 64KB
    std::uint64_t export_progress_interval = 1024 * 1024;
    
    StorageConfig() = default;
    
    explicit StorageConfig(const std::filesystem::path& base_dir);
    
    bool validate() const;
    
    bool create_directories() const;
    
    std::filesystem::path get_blob_path(const std::string& hash_hex) const;
    
    std::filesystem::path get_partial_path(const std::string& hash_hex) const;
    
    void set_base_directory(const std::filesystem::path& base_dir);
};

}
