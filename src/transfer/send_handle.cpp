#include "beamdrop/transfer/send_handle.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/crypto/random.hpp"
#include <fmt/format.h>
#include <thread>

namespace beamdrop::transfer {

namespace {
    template<typename F>
    void run_step(const char* step, const std::filesystem::path& staging_dir, F&& action) {
        try {
            action();
        } catch (const std::exception& e) {
            LOG_WARN("Cleanup of {} failed to {}: {}", staging_dir.string(), step, e.what());
        }
    }
}

SendHandle::SendHandle(std::weak_ptr<core::Runtime> runtime, std::filesystem::path staging_dir)
    : runtime_(std::move(runtime))
    , staging_dir_(std::move(staging_dir))
    , resources_(std::make_shared<Resources>()) {
    resources_->staging_dir = staging_dir_;
}

SendHandle::~SendHandle() {
    close();
}

void SendHandle::attach_store(std::shared_ptr<storage::Store> store) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resources_) {
        resources_->store = std::move(store);
    }
}

void SendHandle::attach_tag(storage::TempTag tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resources_) {
        resources_->tag = std::move(tag);
    }
}

void SendHandle::attach_endpoint(std::unique_ptr<network::Endpoint> endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resources_) {
        resources_->endpoint = std::move(endpoint);
    }
}

void SendHandle::attach_blob_server(std::unique_ptr<network::BlobServer> server) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resources_) {
        resources_->blob_server = std::move(server);
    }
}

void SendHandle::attach_download_server(std::unique_ptr<network::DownloadServer> server) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resources_) {
        resources_->download_server = std::move(server);
    }
}

void SendHandle::attach_tunnel(std::unique_ptr<network::Tunnel> tunnel) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resources_) {
        resources_->tunnel = std::move(tunnel);
    }
}

void SendHandle::set_ticket(std::string ticket) {
    ticket_ = std::move(ticket);
}

std::shared_ptr<SendHandle::Resources> SendHandle::begin_close(std::shared_ptr<std::promise<void>>& done) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return nullptr;
    }
    done = std::make_shared<std::promise<void>>();
    closed_ = done->get_future().share();
    return std::move(resources_);
}

std::shared_future<void> SendHandle::close() {
    std::shared_ptr<std::promise<void>> done;
    auto resources = begin_close(done);
    if (!resources) {
        std::lock_guard<std::mutex> lock(mutex_);
        return *closed_;
    }
    
    std::shared_future<void> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = *closed_;
    }
    
    auto task = [resources, done]() {
        release(*resources);
        done->set_value();
    };
    
    auto runtime = runtime_.lock();
    if (runtime && !runtime->is_stopped()) {
        runtime->post(std::move(task));
    } else {
        // The dropping thread must not wait on server joins or the tunnel
        LOG_DEBUG("No runtime available, releasing {} on its own thread", staging_dir_.string());
        std::thread(std::move(task)).detach();
    }
    return result;
}

void SendHandle::close_and_wait() {
    std::shared_ptr<std::promise<void>> done;
    auto resources = begin_close(done);
    if (!resources) {
        std::shared_future<void> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending = *closed_;
        }
        pending.wait();
        return;
    }
    
    release(*resources);
    done->set_value();
}

bool SendHandle::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_.has_value();
}

network::Endpoint* SendHandle::endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_ ? resources_->endpoint.get() : nullptr;
}

network::BlobServer* SendHandle::blob_server() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_ ? resources_->blob_server.get() : nullptr;
}

network::DownloadServer* SendHandle::download_server() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_ ? resources_->download_server.get() : nullptr;
}

network::Tunnel* SendHandle::tunnel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_ ? resources_->tunnel.get() : nullptr;
}

void SendHandle::release(Resources& resources) {
    const auto& dir = resources.staging_dir;
    LOG_DEBUG("Releasing send session {}", dir.string());
    
    run_step("stop serving", dir, [&]() {
        if (resources.blob_server) {
            resources.blob_server->stop();
        }
        if (resources.download_server) {
            resources.download_server->stop();
        }
    });
    
    run_step("join server threads", dir, [&]() {
        if (resources.blob_server) {
            resources.blob_server->join();
            resources.blob_server.reset();
        }
        if (resources.download_server) {
            resources.download_server->join();
            resources.download_server.reset();
        }
        if (resources.endpoint) {
            resources.endpoint->close();
            resources.endpoint.reset();
        }
    });
    
    run_step("close tunnel", dir, [&]() {
        if (resources.tunnel) {
            resources.tunnel->close();
            resources.tunnel.reset();
        }
    });
    
    run_step("shut down store", dir, [&]() {
        resources.tag.release();
        if (resources.store) {
            resources.store->shutdown();
            resources.store.reset();
        }
    });
    
    run_step("remove staging directory", dir, [&]() {
        if (!dir.empty()) {
            core::utils::FileUtils::remove_all_quietly(dir);
        }
    });
    
    LOG_INFO("Send session {} released", dir.filename().string());
}

std::filesystem::path create_staging_dir(const std::filesystem::path& parent, const std::string& prefix) {
    auto dir = parent / fmt::format("{}{:016x}", prefix, crypto::SecureRandom::generate_uint64());
    
    std::error_code ec;
    if (!std::filesystem::create_directories(dir, ec) || ec) {
        throw core::TransferError(core::ErrorCode::StoreError,
                                  "failed to create staging directory " + dir.string() +
                                  (ec ? ": " + ec.message() : ": already exists"));
    }
    return dir;
}

}
