#pragma once

#include "beamdrop/core/runtime.hpp"
#include "beamdrop/network/blob_server.hpp"
#include "beamdrop/network/download_server.hpp"
#include "beamdrop/network/endpoint.hpp"
#include "beamdrop/network/tunnel.hpp"
#include "beamdrop/storage/store.hpp"
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace beamdrop::transfer {

// Owns everything one outbound transfer acquired. Resources are attached as
// the session acquires them and released in a fixed order:
//   1. stop the listener / HTTP server
//   2. wait for their I/O threads
//   3. close the tunnel
//   4. drop the temp tag and shut the store down
//   5. remove the staging directory
// A failing step is logged and the remaining steps still run.
class SendHandle {
public:
    SendHandle(std::weak_ptr<core::Runtime> runtime, std::filesystem::path staging_dir);
    // Starts an asynchronous close if none was requested.
    ~SendHandle();
    
    SendHandle(const SendHandle&) = delete;
    SendHandle& operator=(const SendHandle&) = delete;
    
    void attach_store(std::shared_ptr<storage::Store> store);
    void attach_tag(storage::TempTag tag);
    void attach_endpoint(std::unique_ptr<network::Endpoint> endpoint);
    void attach_blob_server(std::unique_ptr<network::BlobServer> server);
    void attach_download_server(std::unique_ptr<network::DownloadServer> server);
    void attach_tunnel(std::unique_ptr<network::Tunnel> tunnel);
    
    void set_ticket(std::string ticket);
    const std::string& ticket() const { return ticket_; }
    const std::filesystem::path& staging_dir() const { return staging_dir_; }
    
    // Runs the release steps on the runtime's worker pool, or on a detached
    // thread once the runtime is gone, and returns at once. Repeated calls
    // return the same future.
    std::shared_future<void> close();
    
    // Releases on the calling thread, or waits for a close already running.
    void close_and_wait();
    
    bool is_closed() const;
    
    // Valid until close() is called.
    network::Endpoint* endpoint() const;
    network::BlobServer* blob_server() const;
    network::DownloadServer* download_server() const;
    network::Tunnel* tunnel() const;

private:
    struct Resources {
        // Declared so that servers are destroyed before the endpoint and store
        std::filesystem::path staging_dir;
        std::shared_ptr<storage::Store> store;
        storage::TempTag tag;
        std::unique_ptr<network::Endpoint> endpoint;
        std::unique_ptr<network::Tunnel> tunnel;
        std::unique_ptr<network::DownloadServer> download_server;
        std::unique_ptr<network::BlobServer> blob_server;
    };
    
    static void release(Resources& resources);
    
    // Marks the handle closed and hands over its resources; null if a close
    // was already requested.
    std::shared_ptr<Resources> begin_close(std::shared_ptr<std::promise<void>>& done);
    
    std::weak_ptr<core::Runtime> runtime_;
    std::filesystem::path staging_dir_;
    std::string ticket_;
    
    mutable std::mutex mutex_;
    std::shared_ptr<Resources> resources_;
    std::optional<std::shared_future<void>> closed_;
};

// Creates <parent>/<prefix><16 random hex digits>. Throws TransferError(StoreError).
std::filesystem::path create_staging_dir(const std::filesystem::path& parent, const std::string& prefix);

}
