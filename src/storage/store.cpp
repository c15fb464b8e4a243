#include "beamdrop/storage/store.hpp"
#include "beamdrop/core/error.hpp"
#include <algorithm>

namespace beamdrop::storage {

using core::ErrorCode;
using core::TransferError;

void TempTagSet::acquire(const HashAndFormat& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[value]++;
}

void TempTagSet::release(const HashAndFormat& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(value);
    if (it == counts_.end()) {
        return;
    }
    if (--it->second == 0) {
        counts_.erase(it);
    }
}

std::vector<HashAndFormat> TempTagSet::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HashAndFormat> result;
    result.reserve(counts_.size());
    for (const auto& [value, _] : counts_) {
        result.push_back(value);
    }
    return result;
}

bool TempTagSet::contains(const Hash& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(counts_.begin(), counts_.end(),
                       [&hash](const auto& entry) { return entry.first.hash == hash; });
}

TempTag::TempTag(std::shared_ptr<TempTagSet> owner, HashAndFormat value)
    : owner_(std::move(owner))
    , value_(value) {
    if (owner_) {
        owner_->acquire(value_);
    }
}

TempTag::~TempTag() {
    release();
}

TempTag::TempTag(TempTag&& other) noexcept
    : owner_(std::move(other.owner_))
    , value_(other.value_) {
}

TempTag& TempTag::operator=(TempTag&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = std::move(other.owner_);
        value_ = other.value_;
    }
    return *this;
}

void TempTag::release() {
    if (owner_) {
        owner_->release(value_);
        owner_.reset();
    }
}

std::vector<std::uint8_t> Store::read_to_end(const Hash& hash, std::uint64_t max_size) const {
    auto blob = reader(hash);
    if (blob->size() > max_size) {
        throw TransferError(ErrorCode::StoreError,
                            "blob of " + std::to_string(blob->size()) + " bytes exceeds limit of " +
                            std::to_string(max_size) + " bytes");
    }
    
    std::vector<std::uint8_t> data(static_cast<std::size_t>(blob->size()));
    std::size_t filled = 0;
    while (filled < data.size()) {
        auto n = blob->read(std::span(data.data() + filled, data.size() - filled));
        if (n == 0) {
            throw TransferError(ErrorCode::StoreError, "blob ended before its recorded size");
        }
        filled += n;
    }
    return data;
}

std::vector<Hash> parse_hash_seq(std::span<const std::uint8_t> data) {
    if (data.size() % crypto::HASH_SIZE != 0) {
        throw TransferError(ErrorCode::StoreError,
                            "hash sequence length " + std::to_string(data.size()) +
                            " is not a multiple of " + std::to_string(crypto::HASH_SIZE));
    }
    
    std::vector<Hash> hashes(data.size() / crypto::HASH_SIZE);
    for (std::size_t i = 0; i < hashes.size(); ++i) {
        std::copy_n(data.begin() + i * crypto::HASH_SIZE, crypto::HASH_SIZE, hashes[i].begin());
    }
    return hashes;
}

std::vector<std::uint8_t> encode_hash_seq(const std::vector<Hash>& hashes) {
    std::vector<std::uint8_t> data;
    data.reserve(hashes.size() * crypto::HASH_SIZE);
    for (const auto& hash : hashes) {
        data.insert(data.end(), hash.begin(), hash.end());
    }
    return data;
}

}
