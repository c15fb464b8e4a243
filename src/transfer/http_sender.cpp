#include "beamdrop/transfer/http_sender.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/network/download_server.hpp"
#include "beamdrop/storage/collection_builder.hpp"
#include "beamdrop/storage/fs_store.hpp"

namespace beamdrop::transfer {

using core::ErrorCode;
using core::TransferError;

namespace {
    std::string join_url(std::string base, const std::string& path) {
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        return base + path;
    }
}

std::shared_ptr<SendHandle> send_http(const std::filesystem::path& path, const TransferOptions& options,
                                      const std::shared_ptr<network::TunnelConnector>& connector,
                                      const std::shared_ptr<core::Runtime>& runtime, SendChannel& events) {
    std::shared_ptr<SendHandle> handle;
    
    try {
        emit(events, send_status::Connecting{});
        
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            throw TransferError(ErrorCode::UnsupportedInput,
                                "sending directories via web link is not supported; select a single file");
        }
        if (!connector) {
            throw TransferError(ErrorCode::TunnelError, "no tunnel connector configured");
        }
        
        handle = std::make_shared<SendHandle>(runtime, create_staging_dir(options.staging_root(), "beamdrop-http-"));
        
        auto store = std::make_shared<storage::FsStore>(handle->staging_dir());
        handle->attach_store(store);
        
        storage::CollectionBuilder builder(options.walk_policy);
        auto imported = builder.import(path, *store, [&](const storage::ImportProgress& progress) {
            emit(events, send_status::Importing{progress.total_files, progress.done_files,
                                                progress.total_size, progress.done_size});
        });
        if (imported.collection.size() != 1) {
            throw TransferError(ErrorCode::UnsupportedInput,
                                "web link transfers need exactly one file, found " +
                                std::to_string(imported.collection.size()));
        }
        
        const auto& [name, hash] = imported.collection[0];
        network::DownloadTarget target{hash, std::filesystem::path(name).filename().string()};
        handle->attach_tag(std::move(imported.tag));
        
        emit(events, send_status::Connecting{});
        
        auto server = std::make_unique<network::DownloadServer>(store, target, options.http_threads);
        server->start("127.0.0.1", 0);
        auto local_url = server->local_url();
        auto download_path = server->download_path();
        handle->attach_download_server(std::move(server));
        
        auto tunnel = connector->open(local_url);
        auto url = join_url(tunnel->public_url(), download_path);
        handle->attach_tunnel(std::move(tunnel));
        handle->set_ticket(url);
        
        LOG_INFO("Serving {} ({} bytes) at {}", target.name, imported.total_size, url);
        emit(events, send_status::ReadyToSend{url});
        return handle;
        
    } catch (const std::exception& e) {
        LOG_ERROR("Web link send of {} failed: {}", path.string(), e.what());
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
