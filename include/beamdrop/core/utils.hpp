#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace beamdrop::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    static bool is_valid_utf8(const std::string& str);
};

class EncodingUtils {
public:
    static std::string to_hex(std::span<const std::uint8_t> data);
    static std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex);
    
    // RFC 4648 base32, lowercase alphabet, no padding.
    static std::string to_base32(std::span<const std::uint8_t> data);
    static std::optional<std::vector<std::uint8_t>> from_base32(const std::string& text);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static std::filesystem::path get_temp_dir();
    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_home(const std::string& path);
    static std::optional<std::string> read_file(const std::filesystem::path& path);
    static bool write_file(const std::filesystem::path& path, const std::string& content);
    
    // Returns false and logs on failure; never throws.
    static bool remove_all_quietly(const std::filesystem::path& path);
};

}
