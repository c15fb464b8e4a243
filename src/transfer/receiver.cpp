#include "beamdrop/transfer/receiver.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/network/blob_client.hpp"
#include "beamdrop/network/endpoint.hpp"
#include "beamdrop/network/protocol.hpp"
#include "beamdrop/storage/collection.hpp"
#include "beamdrop/storage/collection_exporter.hpp"
#include "beamdrop/storage/fs_store.hpp"

namespace beamdrop::transfer {

using core::ErrorCode;
using core::TransferError;

namespace {
    void check_cancelled(const core::CancellationToken* cancel) {
        if (cancel) {
            cancel->throw_if_cancelled();
        }
    }
    
    void download_missing(const network::BlobTicket& ticket, storage::Store& store,
                          const TransferOptions& options, ReceiveChannel& events,
                          const core::CancellationToken* cancel) {
        storage::HashAndFormat root{ticket.hash(), storage::BlobFormat::HashSeq};
        
        network::Endpoint endpoint(crypto::SecretKey::generate(), options.endpoint_options({}));
        auto connection = endpoint.connect(ticket.addr(), network::BLOBS_ALPN);
        network::BlobClient client(*connection);
        
        auto manifest = client.get_hash_seq_and_sizes(store, ticket.hash(), options.max_manifest_size);
        std::uint64_t content_size = manifest.total_size() - manifest.sizes.front();
        emit(events, receive_status::Connected{manifest.hash_seq.size() - 1, content_size});
        check_cancelled(cancel);
        
        // The root is local now, so this lists exactly the children still needed
        auto local = store.local(root);
        auto total = manifest.total_size();
        auto already_local = local.local_bytes;
        LOG_INFO("Downloading {} blobs, {} of {} bytes already local",
                 local.missing.size(), already_local, total);
        
        client.execute_get(store, local.missing, [&](std::uint64_t offset) {
            check_cancelled(cancel);
            emit(events, receive_status::Downloading{already_local + offset, total});
        });
        
        client.disconnect();
        endpoint.close();
    }
    
    void receive_into(const network::BlobTicket& ticket, const std::filesystem::path& staging_dir,
                      ReceiveChannel& events, const TransferOptions& options,
                      const core::CancellationToken* cancel) {
        emit(events, receive_status::Connecting{});
        
        storage::FsStore store(staging_dir);
        auto local = store.local({ticket.hash(), storage::BlobFormat::HashSeq});
        if (!local.complete) {
            download_missing(ticket, store, options, events, cancel);
        } else {
            LOG_INFO("Collection {} is already complete locally", crypto::hash_utils::hash_to_hex(ticket.hash()));
        }
        check_cancelled(cancel);
        
        auto collection = storage::Collection::load(store, ticket.hash());
        storage::CollectionExporter exporter;
        exporter.export_collection(store, collection, options.output_dir,
            [&](const storage::ExportProgress& progress) {
                check_cancelled(cancel);
                emit(events, receive_status::Exporting{progress.total_files, progress.done_files});
            });
        
        store.shutdown();
        LOG_INFO("Received {} files", collection.size());
    }
}

std::filesystem::path receive_staging_dir(const TransferOptions& options, const crypto::Hash& hash) {
    return options.staging_root() / (".beamdrop-recv-" + crypto::hash_utils::hash_to_hex(hash));
}

bool receive(const std::string& ticket_text, ReceiveChannel& events, const TransferOptions& options,
             const core::CancellationToken* cancel) {
    auto report_error = [&](const std::string& message) {
        if (!events.send(receive_status::Error{message})) {
            LOG_DEBUG("Status channel closed before the error was reported");
        }
    };
    
    std::optional<network::BlobTicket> ticket;
    try {
        ticket = network::BlobTicket::parse(core::utils::StringUtils::trim(ticket_text));
    } catch (const TransferError& e) {
        LOG_ERROR("Rejected ticket: {}", e.what());
        report_error(e.what());
        return false;
    }
    
    if (ticket->format() != storage::BlobFormat::HashSeq) {
        report_error("ticket does not name a collection");
        return false;
    }
    
    auto staging_dir = receive_staging_dir(options, ticket->hash());
    std::optional<std::string> failure;
    try {
        receive_into(*ticket, staging_dir, events, options, cancel);
    } catch (const std::exception& e) {
        failure = e.what();
    }
    
    core::utils::FileUtils::remove_all_quietly(staging_dir);
    
    if (failure) {
        LOG_ERROR("Receive failed: {}", *failure);
        report_error(*failure);
        return false;
    }
    
    if (!events.send(receive_status::Done{})) {
        LOG_DEBUG("Status channel closed before completion was reported");
    }
    return true;
}

}
