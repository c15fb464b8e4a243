#include "beamdrop/core/config.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include <charconv>
#include <fstream>

namespace beamdrop::core {

using utils::StringUtils;

namespace {
    std::string unquote(const std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }
    
    std::pair<std::string, std::string> split_key(const std::string& key) {
        auto dot = key.find('.');
        if (dot == std::string::npos) {
            return {"", key};
        }
        return {key.substr(0, dot), key.substr(dot + 1)};
    }
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string section;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = StringUtils::trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        if (line.front() == '[' && line.back() == ']') {
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            LOG_WARN("{}:{}: ignoring line without '='", filename, line_number);
            continue;
        }
        
        auto key = StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring value without a key", filename, line_number);
            continue;
        }
        if (!section.empty()) {
            key = section + "." + key;
        }
        values_[key] = unquote(StringUtils::trim(line.substr(eq_pos + 1)));
    }
    
    LOG_DEBUG("Loaded {} settings from {}", values_.size(), filename);
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# BeamDrop configuration\n";
    
    // Keys are sorted, so each section is written once
    std::string current_section;
    bool first = true;
    for (const auto& [key, value] : values_) {
        auto [section, name] = split_key(key);
        if (first || section != current_section) {
            file << "\n";
            if (!section.empty()) {
                file << "[" << section << "]\n";
            }
            current_section = section;
            first = false;
        }
        file << name << " = " << value << "\n";
    }
    
    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> Config::get_number(const std::string& key) const {
    auto value = get(key);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    
    T result{};
    auto [end, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
    if (ec != std::errc() || end != value->data() + value->size()) {
        LOG_WARN("Setting {}='{}' is not a valid number", key, *value);
        return std::nullopt;
    }
    return result;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    auto lower = StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_number<int>(key).value_or(default_value);
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    return get_number<std::uint64_t>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::chrono::milliseconds Config::get_milliseconds(const std::string& key,
                                                   std::chrono::milliseconds default_value) const {
    auto value = get_number<std::int64_t>(key);
    if (!value || *value < 0) {
        return default_value;
    }
    return std::chrono::milliseconds(*value);
}

void Config::set_defaults() {
    values_["p2p.relay_mode"] = "default";
    values_["p2p.relay_url"] = "";
    values_["p2p.online_timeout_ms"] = "10000";
    values_["p2p.bind_address"] = "0.0.0.0";
    values_["net.io_timeout_ms"] = "30000";
    values_["receive.max_manifest_size"] = "33554432";
    values_["receive.output_dir"] = "";
    values_["transfer.channel_capacity"] = "32";
    values_["import.tolerate_walk_errors"] = "true";
    values_["http.threads"] = "2";
    values_["tunnel.binary"] = "ngrok";
    values_["tunnel.start_timeout_ms"] = "15000";
    values_["runtime.workers"] = "4";
    values_["log.level"] = "info";
    values_["log.file"] = "~/.beamdrop/beamdrop.log";
}

}
