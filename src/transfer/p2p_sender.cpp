#include "beamdrop/transfer/p2p_sender.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/network/protocol.hpp"
#include "beamdrop/network/ticket.hpp"
#include "beamdrop/storage/collection_builder.hpp"
#include "beamdrop/storage/fs_store.hpp"

namespace beamdrop::transfer {

using core::ErrorCode;
using core::TransferError;

std::shared_ptr<SendHandle> send_p2p(const std::filesystem::path& path, const TransferOptions& options,
                                     const std::shared_ptr<core::Runtime>& runtime, SendChannel& events) {
    std::shared_ptr<SendHandle> handle;
    
    try {
        emit(events, send_status::Connecting{});
        
        auto endpoint = std::make_unique<network::Endpoint>(
            crypto::SecretKey::generate(), options.endpoint_options({network::BLOBS_ALPN}));
        auto* endpoint_ref = endpoint.get();
        LOG_INFO("P2P endpoint {} listening on port {}",
                 crypto::node_id_short(endpoint->node_id()), endpoint->port());
        
        handle = std::make_shared<SendHandle>(runtime, create_staging_dir(options.staging_root(), "beamdrop-p2p-"));
        handle->attach_endpoint(std::move(endpoint));
        
        auto store = std::make_shared<storage::FsStore>(handle->staging_dir());
        handle->attach_store(store);
        
        storage::CollectionBuilder builder(options.walk_policy);
        auto imported = builder.import(path, *store, [&](const storage::ImportProgress& progress) {
            emit(events, send_status::Importing{progress.total_files, progress.done_files,
                                                progress.total_size, progress.done_size});
        });
        if (imported.skipped_entries > 0) {
            LOG_WARN("Skipped {} unreadable entries under {}", imported.skipped_entries, path.string());
        }
        
        auto root = imported.tag.hash();
        handle->attach_tag(std::move(imported.tag));
        
        auto server = std::make_unique<network::BlobServer>(*endpoint_ref, store);
        if (!server->start()) {
            throw TransferError(ErrorCode::TransportError, "failed to start blob server");
        }
        handle->attach_blob_server(std::move(server));
        
        if (options.relay_mode != network::RelayMode::Disabled) {
            endpoint_ref->wait_online(options.online_timeout);
        }
        
        network::BlobTicket ticket(endpoint_ref->addr(), root, storage::BlobFormat::HashSeq);
        handle->set_ticket(ticket.to_string());
        
        LOG_INFO("Sharing {} files ({} bytes) from {}", imported.collection.size(), imported.total_size,
                 path.string());
        emit(events, send_status::ReadyToSend{handle->ticket()});
        return handle;
        
    } catch (const std::exception& e) {
        LOG_ERROR("P2P send of {} failed: {}", path.string(), e.what());
        if (handle) {
            handle->close_and_wait();
        }
        if (!events.send(send_status::Error{e.what()})) {
            LOG_DEBUG("Status channel closed before the error was reported");
        }
        return nullptr;
    }
}

}
