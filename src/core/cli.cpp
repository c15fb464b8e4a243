#include "beamdrop/core/cli.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/network/protocol.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>

namespace beamdrop::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {
    
    add_option("h", "help", "Show this help message");
    add_option("", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.beamdrop.conf");
    add_option("v", "verbose", "Enable verbose logging");
    add_option("r", "relay", "Relay mode (default, disabled) or a relay URL", true);
    add_option("o", "output", "Directory received files are written to", true);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    options_[long_name] = Option{short_name, description, has_value, default_value};
    if (!short_name.empty()) {
        short_to_long_[short_name] = long_name;
    }
}

bool CommandLineParser::fail(std::string message) {
    error_ = std::move(message);
    return false;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
        } else if (arg == "--") {
            options_done = true;
        } else if (arg.starts_with("--")) {
            if (!parse_long(arg, i, argc, argv)) {
                return false;
            }
        } else if (!parse_short(arg, i, argc, argv)) {
            return false;
        }
    }
    
    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int& index, int argc, char* argv[]) {
    auto eq_pos = arg.find('=');
    auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
    
    auto it = options_.find(name);
    if (it == options_.end()) {
        return fail("Unknown option: --" + name);
    }
    
    if (!it->second.has_value) {
        if (eq_pos != std::string::npos) {
            return fail("Option --" + name + " does not take a value");
        }
        parsed_options_[name] = "true";
        return true;
    }
    
    if (eq_pos != std::string::npos) {
        parsed_options_[name] = arg.substr(eq_pos + 1);
    } else if (index + 1 < argc) {
        parsed_options_[name] = argv[++index];
    } else {
        return fail("Option --" + name + " requires a value");
    }
    return true;
}

bool CommandLineParser::parse_short(const std::string& arg, int& index, int argc, char* argv[]) {
    // Flags may be grouped (-hv); a value option consumes the rest of the group
    for (std::size_t pos = 1; pos < arg.size(); ++pos) {
        std::string short_name(1, arg[pos]);
        auto long_it = short_to_long_.find(short_name);
        if (long_it == short_to_long_.end()) {
            return fail("Unknown option: -" + short_name);
        }
        
        const auto& name = long_it->second;
        if (!options_.at(name).has_value) {
            parsed_options_[name] = "true";
            continue;
        }
        
        if (pos + 1 < arg.size()) {
            parsed_options_[name] = arg.substr(pos + 1);
        } else if (index + 1 < argc) {
            parsed_options_[name] = argv[++index];
        } else {
            return fail("Option -" + short_name + " requires a value");
        }
        break;
    }
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto normalized = normalize_option_name(name);
    if (auto it = parsed_options_.find(normalized); it != parsed_options_.end()) {
        return it->second;
    }
    
    auto opt_it = options_.find(normalized);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    int result = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
        return default_value;
    }
    return result;
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) {
        return default_value;
    }
    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes" || value.empty();
}

std::filesystem::path CommandLineParser::get_path_option(const std::string& name) const {
    auto value = get_option(name);
    if (value.empty()) {
        return {};
    }
    return utils::FileUtils::expand_home(value);
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";
    
    for (const auto& [name, option] : options_) {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + name + (option.has_value ? " <value>" : "");
        
        out << "  " << std::left << std::setw(26) << flags << option.description;
        if (!option.default_value.empty()) {
            out << " (default: " << option.default_value << ")";
        }
        out << "\n";
    }
}

void CommandLineParser::print_help() const {
    print_help(std::cout);
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 0.3.0\n";
    std::cout << "Blob protocol: " << network::BLOBS_ALPN << "\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
