#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace beamdrop::core {

// Flat key=value settings. In a file, "[p2p]" prefixes the keys that follow
// with "p2p.", so "relay_mode = disabled" below it sets p2p.relay_mode.
class Config {
public:
    Config() = default;
    
    static Config& instance();
    
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    std::chrono::milliseconds get_milliseconds(const std::string& key, std::chrono::milliseconds default_value) const;
    
    void set_defaults();
    void clear() { values_.clear(); }
    std::size_t size() const { return values_.size(); }

private:
    template<typename T>
    std::optional<T> get_number(const std::string& key) const;
    
    std::map<std::string, std::string> values_;
};

}
