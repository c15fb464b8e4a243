#pragma once

#include "beamdrop/core/config.hpp"
#include "beamdrop/network/endpoint.hpp"
#include "beamdrop/network/tunnel.hpp"
#include "beamdrop/storage/collection_builder.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace beamdrop::transfer {

constexpr std::uint64_t DEFAULT_MAX_MANIFEST_SIZE = 32ull * 1024 * 1024;

struct TransferOptions {
    network::RelayMode relay_mode = network::RelayMode::Default;
    std::string relay_url;
    std::string bind_address = "0.0.0.0";
    std::chrono::milliseconds online_timeout{10000};
    std::chrono::milliseconds io_timeout{30000};
    
    std::uint64_t max_manifest_size = DEFAULT_MAX_MANIFEST_SIZE;
    std::size_t channel_capacity = 32;
    storage::WalkPolicy walk_policy;
    
    std::size_t http_threads = 2;
    network::NgrokOptions tunnel;
    std::size_t runtime_workers = 4;
    
    // Where received files are written; empty means the current directory
    std::filesystem::path output_dir;
    // Parent of staging directories; empty means the system temp directory
    std::filesystem::path temp_dir;
    
    static TransferOptions from_config(const core::Config& config);
    
    network::EndpointOptions endpoint_options(std::vector<std::string> alpns) const;
    std::filesystem::path staging_root() const;
};

}
