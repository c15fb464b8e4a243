#include <iostream>
#include <string>
#include <vector>
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/config.hpp"
#include "beamdrop/core/cli.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/core/command_registry.hpp"
#include "beamdrop/transfer/transfer_options.hpp"

namespace {

// --relay accepts a mode name or a relay URL
bool apply_relay_option(const std::string& value, beamdrop::transfer::TransferOptions& options) {
    if (auto mode = beamdrop::network::parse_relay_mode(value)) {
        options.relay_mode = *mode;
        return *mode != beamdrop::network::RelayMode::Custom || !options.relay_url.empty();
    }
    if (value.find("://") == std::string::npos) {
        return false;
    }
    options.relay_mode = beamdrop::network::RelayMode::Custom;
    options.relay_url = value;
    return true;
}

}

int main(int argc, char* argv[]) {
    beamdrop::core::CommandLineParser parser("beamdrop");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = beamdrop::core::Config::instance();
    config.set_defaults();
    
    auto config_file = parser.get_path_option("config");
    if (beamdrop::core::utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Warning: could not read " << config_file << "\n";
    }
    
    auto log_level = parser.has_option("verbose")
        ? beamdrop::core::LogLevel::Debug
        : beamdrop::core::Logger::parse_level(config.get_string("log.level", "info"));
    auto log_file = beamdrop::core::utils::FileUtils::expand_home(config.get_string("log.file", "beamdrop.log"));
    beamdrop::core::Logger::initialize(log_file.string(), log_level);
    
    LOG_INFO("BeamDrop starting up");
    
    auto options = beamdrop::transfer::TransferOptions::from_config(config);
    if (parser.has_option("relay") && !apply_relay_option(parser.get_option("relay"), options)) {
        std::cerr << "Error: invalid relay setting '" << parser.get_option("relay") << "'\n";
        return 1;
    }
    if (parser.has_option("output")) {
        options.output_dir = parser.get_path_option("output");
    }
    
    beamdrop::core::CommandRegistry command_registry(options);
    
    const auto& args = parser.get_positional_args();
    if (parser.has_option("help") || args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    const auto& command = args[0];
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            command_registry.print_help();
        }
    }
    
    LOG_INFO("BeamDrop exiting with code {}", result.exit_code);
    beamdrop::core::Logger::shutdown();
    return result.exit_code;
}
