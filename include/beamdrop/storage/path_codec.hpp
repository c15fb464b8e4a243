#pragma once

#include <filesystem>
#include <string>

namespace beamdrop::storage::path_codec {

// Converts a filesystem path to a canonical collection name: normal
// components joined with '/'. Throws TransferError with InvalidPathComponent
// for '..', '.', backslashes, embedded '/', or a root when must_be_relative
// is set, and InvalidEncoding for components that are not valid UTF-8.
std::string encode(const std::filesystem::path& path, bool must_be_relative);

// Resolves an untrusted collection name below root. Every part is checked;
// names are never trusted because they arrive from the sending peer.
std::filesystem::path decode(const std::filesystem::path& root, const std::string& name);

// Validation only, no filesystem access.
bool is_valid_name(const std::string& name);

}
