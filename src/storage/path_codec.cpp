#include "beamdrop/storage/path_codec.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/utils.hpp"
#include <vector>

namespace beamdrop::storage::path_codec {

using core::ErrorCode;
using core::TransferError;

namespace {
    std::vector<std::string> split_name(const std::string& name) {
        std::vector<std::string> parts;
        std::string::size_type start = 0;
        while (true) {
            auto pos = name.find('/', start);
            if (pos == std::string::npos) {
                parts.push_back(name.substr(start));
                break;
            }
            parts.push_back(name.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }
    
    const char* check_part(const std::string& part) {
        if (part.empty()) return "empty path component";
        if (part == "..") return "parent directory reference";
        if (part == ".") return "current directory reference";
        if (part.find('\\') != std::string::npos) return "backslash in path component";
        if (part.find('\0') != std::string::npos) return "NUL byte in path component";
        return nullptr;
    }
}

std::string encode(const std::filesystem::path& path, bool must_be_relative) {
    const auto text = path.string();
    if (text.find('\\') != std::string::npos) {
        throw TransferError(ErrorCode::InvalidPathComponent,
                            "path must not contain backslashes: " + text);
    }
    
    auto it = path.begin();
    if (path.has_root_name()) {
        throw TransferError(ErrorCode::InvalidPathComponent,
                            "invalid path component: " + path.root_name().string());
    }
    if (path.has_root_directory()) {
        if (must_be_relative) {
            throw TransferError(ErrorCode::InvalidPathComponent,
                                "invalid path component: absolute path " + text);
        }
        ++it;
    }
    
    std::vector<std::string> parts;
    for (; it != path.end(); ++it) {
        const auto part = it->string();
        
        // Trailing separators show up as an empty element
        if (part.empty()) {
            continue;
        }
        
        if (part == ".." || part == ".") {
            throw TransferError(ErrorCode::InvalidPathComponent, "invalid path component: " + part);
        }
        
        if (!core::utils::StringUtils::is_valid_utf8(part)) {
            throw TransferError(ErrorCode::InvalidEncoding, "invalid characters in path: " + text);
        }
        
        if (part.find('/') != std::string::npos) {
            throw TransferError(ErrorCode::InvalidPathComponent, "invalid path component: " + part);
        }
        
        parts.push_back(part);
    }
    
    return core::utils::StringUtils::join(parts, "/");
}

std::filesystem::path decode(const std::filesystem::path& root, const std::string& name) {
    auto path = root;
    for (const auto& part : split_name(name)) {
        if (const char* reason = check_part(part)) {
            throw TransferError(ErrorCode::InvalidPathComponent,
                                std::string("invalid path component '") + part + "' in " + name + ": " + reason);
        }
        path /= part;
    }
    return path;
}

bool is_valid_name(const std::string& name) {
    for (const auto& part : split_name(name)) {
        if (check_part(part)) {
            return false;
        }
    }
    return core::utils::StringUtils::is_valid_utf8(name);
}

}
