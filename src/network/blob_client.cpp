#include "beamdrop/network/blob_client.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/crypto/hash.hpp"
#include <limits>
#include <numeric>

namespace beamdrop::network {

using core::TransferError;
using crypto::hash_utils::hash_to_hex;

std::uint64_t HashSeqAndSizes::total_size() const {
    return std::accumulate(sizes.begin(), sizes.end(), std::uint64_t{0});
}

BlobClient::BlobClient(BlockingConnection& connection)
    : connection_(connection) {
}

Frame BlobClient::expect(MessageType type) {
    auto frame = connection_.receive();
    if (frame.header.type == MessageType::ERROR_RESPONSE) {
        auto error = ErrorMessage::deserialize(frame.payload);
        throw TransferError(core::ErrorCode::TransportError,
                            "peer error " + std::to_string(error.error_code) + ": " + error.error_message);
    }
    if (frame.header.type != type) {
        throw TransferError(core::ErrorCode::ProtocolError,
                            "expected message type " + std::to_string(static_cast<int>(type)) +
                            ", got " + std::to_string(static_cast<int>(frame.header.type)));
    }
    return frame;
}

std::uint64_t BlobClient::fetch_blob(storage::Store& store, const crypto::Hash& hash,
                                     std::uint64_t max_size, const GetProgressHandler& progress) {
    auto writer = store.begin_partial(hash);
    auto start_offset = writer->offset();
    
    connection_.send_message(MessageType::GET_REQUEST, GetRequestMessage{hash, start_offset});
    
    auto header = BlobHeaderMessage::deserialize(expect(MessageType::BLOB_HEADER).payload);
    if (header.hash != hash) {
        throw TransferError(core::ErrorCode::ProtocolError, "peer sent a different blob than requested");
    }
    if (header.size > max_size) {
        throw TransferError(core::ErrorCode::ProtocolError,
                            "blob " + hash_to_hex(hash) + " of " + std::to_string(header.size) +
                            " bytes exceeds limit of " + std::to_string(max_size));
    }
    if (header.offset != start_offset || start_offset > header.size) {
        // Local partial data cannot belong to this blob; start over next time
        writer->discard();
        throw TransferError(core::ErrorCode::ProtocolError,
                            "peer resumed blob " + hash_to_hex(hash) + " at an unexpected offset");
    }
    
    std::uint64_t received = 0;
    while (true) {
        auto frame = connection_.receive();
        if (frame.header.type == MessageType::BLOB_DATA) {
            if (writer->offset() + frame.payload.size() > header.size) {
                writer->discard();
                throw TransferError(core::ErrorCode::ProtocolError,
                                    "peer sent more data than announced for " + hash_to_hex(hash));
            }
            writer->write(frame.payload);
            received += frame.payload.size();
            progress(received);
            continue;
        }
        if (frame.header.type == MessageType::BLOB_END) {
            auto end = BlobEndMessage::deserialize(frame.payload);
            if (end.hash != hash || writer->offset() != header.size) {
                writer->discard();
                throw TransferError(core::ErrorCode::ProtocolError,
                                    "blob " + hash_to_hex(hash) + " ended early");
            }
            break;
        }
        if (frame.header.type == MessageType::ERROR_RESPONSE) {
            auto error = ErrorMessage::deserialize(frame.payload);
            throw TransferError(core::ErrorCode::TransportError, "peer error: " + error.error_message);
        }
        throw TransferError(core::ErrorCode::ProtocolError,
                            "unexpected message " + std::to_string(static_cast<int>(frame.header.type)) +
                            " while receiving blob");
    }
    
    try {
        writer->complete();
    } catch (const TransferError& e) {
        throw TransferError(core::ErrorCode::TransportError, e.what());
    }
    
    LOG_DEBUG("Fetched blob {} ({} bytes, {} resumed)", hash_to_hex(hash), header.size, start_offset);
    return received;
}

HashSeqAndSizes BlobClient::get_hash_seq_and_sizes(storage::Store& store, const crypto::Hash& root,
                                                   std::uint64_t max_size) {
    if (!store.has(root)) {
        fetch_blob(store, root, max_size, [](std::uint64_t) {});
    }
    
    auto root_size = store.size(root);
    if (!root_size || *root_size > max_size) {
        throw TransferError(core::ErrorCode::ProtocolError, "hash sequence exceeds size limit");
    }
    
    HashSeqAndSizes result;
    result.hash_seq = storage::parse_hash_seq(store.read_to_end(root, max_size));
    if (result.hash_seq.empty()) {
        throw TransferError(core::ErrorCode::ProtocolError, "hash sequence is empty");
    }
    
    connection_.send_message(MessageType::SIZE_REQUEST, SizeRequestMessage{result.hash_seq});
    auto response = SizeResponseMessage::deserialize(expect(MessageType::SIZE_RESPONSE).payload);
    if (response.sizes.size() != result.hash_seq.size()) {
        throw TransferError(core::ErrorCode::ProtocolError, "size response does not match request");
    }
    result.sizes = std::move(response.sizes);
    return result;
}

void BlobClient::execute_get(storage::Store& store, const std::vector<storage::MissingBlob>& missing,
                             const GetProgressHandler& progress) {
    std::uint64_t total = 0;
    for (const auto& blob : missing) {
        auto base = total;
        total += fetch_blob(store, blob.hash, std::numeric_limits<std::uint64_t>::max(),
                            [&](std::uint64_t received) { progress(base + received); });
    }
}

void BlobClient::disconnect() {
    if (!connection_.is_open()) {
        return;
    }
    try {
        connection_.send_raw(MessageType::DISCONNECT, {});
    } catch (const TransferError& e) {
        LOG_DEBUG("Disconnect not delivered: {}", e.what());
    }
    connection_.close();
}

}
