#include "beamdrop/transfer/transfer_options.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"

namespace beamdrop::transfer {

TransferOptions TransferOptions::from_config(const core::Config& config) {
    TransferOptions options;
    
    auto mode_name = config.get_string("p2p.relay_mode", "default");
    if (auto mode = network::parse_relay_mode(mode_name)) {
        options.relay_mode = *mode;
    } else {
        LOG_WARN("Unknown relay mode '{}', using default", mode_name);
    }
    options.relay_url = config.get_string("p2p.relay_url", "");
    options.bind_address = config.get_string("p2p.bind_address", options.bind_address);
    options.online_timeout = config.get_milliseconds("p2p.online_timeout_ms", options.online_timeout);
    options.io_timeout = config.get_milliseconds("net.io_timeout_ms", options.io_timeout);
    
    options.max_manifest_size = config.get_uint64("receive.max_manifest_size", options.max_manifest_size);
    options.channel_capacity = config.get_uint64("transfer.channel_capacity", options.channel_capacity);
    options.walk_policy.tolerate_entry_errors =
        config.get_bool("import.tolerate_walk_errors", options.walk_policy.tolerate_entry_errors);
    
    options.http_threads = config.get_uint64("http.threads", options.http_threads);
    options.tunnel.binary = config.get_string("tunnel.binary", options.tunnel.binary);
    options.tunnel.start_timeout = config.get_milliseconds("tunnel.start_timeout_ms", options.tunnel.start_timeout);
    options.runtime_workers = config.get_uint64("runtime.workers", options.runtime_workers);
    
    if (auto output = config.get("receive.output_dir"); output && !output->empty()) {
        options.output_dir = core::utils::FileUtils::expand_home(*output);
    }
    return options;
}

network::EndpointOptions TransferOptions::endpoint_options(std::vector<std::string> alpns) const {
    network::EndpointOptions options;
    options.relay_mode = relay_mode;
    options.relay_url = relay_url;
    options.bind_address = bind_address;
    options.alpns = std::move(alpns);
    options.io_timeout = io_timeout;
    return options;
}

std::filesystem::path TransferOptions::staging_root() const {
    return temp_dir.empty() ? core::utils::FileUtils::get_temp_dir() : temp_dir;
}

}
