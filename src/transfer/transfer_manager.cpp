#include "beamdrop/transfer/transfer_manager.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/crypto/hash.hpp"
#include "beamdrop/crypto/random.hpp"
#include "beamdrop/network/ticket.hpp"
#include "beamdrop/transfer/http_sender.hpp"
#include "beamdrop/transfer/p2p_sender.hpp"
#include "beamdrop/transfer/receiver.hpp"
#include <fmt/format.h>

namespace beamdrop::transfer {

using core::ErrorCode;
using core::TransferError;

TransferManager::TransferManager(TransferOptions options,
                                 std::shared_ptr<network::TunnelConnector> connector,
                                 std::shared_ptr<core::Runtime> runtime)
    : options_(std::move(options))
    , connector_(std::move(connector))
    , runtime_(std::move(runtime))
    , stopped_(false) {
    
    if (!connector_) {
        connector_ = std::make_shared<network::NgrokTunnelConnector>(options_.tunnel);
    }
    if (!runtime_) {
        runtime_ = core::Runtime::create(options_.runtime_workers);
    }
}

TransferManager::~TransferManager() {
    shutdown();
}

SendSessionInfo TransferManager::start_send(const std::filesystem::path& path) {
    return launch_send(SendKind::P2P, path);
}

SendSessionInfo TransferManager::start_http_send(const std::filesystem::path& path) {
    return launch_send(SendKind::Http, path);
}

SendSessionInfo TransferManager::launch_send(SendKind kind, const std::filesystem::path& path) {
    auto session = std::make_shared<SendSession>();
    session->kind = kind;
    session->path = path;
    session->events = SendChannel::create(options_.channel_capacity);
    
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (stopped_) {
            throw TransferError(ErrorCode::Cancelled, "transfer manager is shut down");
        }
        if (kind == SendKind::Http && http_session_) {
            throw TransferError(ErrorCode::UnsupportedInput,
                                "a web link transfer is already active; cancel it first");
        }
        
        session_id = generate_session_id(kind == SendKind::Http ? "http" : "send");
        sends_[session_id] = session;
        if (kind == SendKind::Http) {
            http_session_ = session_id;
        }
    }
    
    LOG_INFO("Starting {} send {} of {}", kind == SendKind::Http ? "web link" : "P2P",
             session_id, path.string());
    
    runtime_->post([this, session_id, session]() {
        std::shared_ptr<SendHandle> handle;
        if (session->kind == SendKind::Http) {
            handle = send_http(session->path, options_, connector_, runtime_, *session->events);
        } else {
            handle = send_p2p(session->path, options_, runtime_, *session->events);
        }
        finish_start(session_id, session, std::move(handle));
    });
    
    return SendSessionInfo{session_id, session->events};
}

void TransferManager::finish_start(const std::string& session_id, std::shared_ptr<SendSession> session,
                                   std::shared_ptr<SendHandle> handle) {
    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sends_.find(session_id);
        registered = it != sends_.end() && it->second == session;
        
        if (registered && handle) {
            session->handle = handle;
            return;
        }
        if (registered) {
            sends_.erase(it);
        }
        if (http_session_ == session_id) {
            http_session_.reset();
        }
    }
    
    if (!handle) {
        // The session already reported its error
        session->events->close();
        return;
    }
    
    // Cancelled while starting
    LOG_INFO("Send {} was cancelled before it became ready", session_id);
    finish_cancelled(*session->events, handle);
}

void TransferManager::finish_cancelled(SendChannel& events, const std::shared_ptr<SendHandle>& handle) {
    if (handle) {
        handle->close();
    }
    if (!events.send(send_status::Done{})) {
        LOG_DEBUG("Status channel closed before cancellation was reported");
    }
    events.close();
}

bool TransferManager::cancel(const std::string& session_id) {
    std::shared_ptr<SendSession> session;
    std::shared_ptr<SendHandle> handle;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sends_.find(session_id);
        if (it == sends_.end()) {
            return false;
        }
        session = it->second;
        handle = session->handle;
        sends_.erase(it);
        if (http_session_ == session_id) {
            http_session_.reset();
        }
        
        // Still starting; finish_start sees the missing entry and cleans up
        if (!handle) {
            LOG_INFO("Cancelling send {} while it starts", session_id);
            return true;
        }
    }
    
    LOG_INFO("Cancelling send {}", session_id);
    finish_cancelled(*session->events, handle);
    return true;
}

ReceiveSessionInfo TransferManager::receive(const std::string& ticket) {
    ReceiveSession session;
    session.events = ReceiveChannel::create(options_.channel_capacity);
    session.cancel = std::make_shared<core::CancellationToken>();
    
    // Receives of one collection share a staging directory; malformed
    // tickets are left for the session to report
    try {
        auto parsed = network::BlobTicket::parse(core::utils::StringUtils::trim(ticket));
        session.collection = crypto::hash_utils::hash_to_hex(parsed.hash());
    } catch (const TransferError&) {
        session.collection.clear();
    }
    
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (stopped_) {
            throw TransferError(ErrorCode::Cancelled, "transfer manager is shut down");
        }
        if (!session.collection.empty()) {
            for (const auto& [other_id, other] : receives_) {
                if (other.collection == session.collection) {
                    throw TransferError(ErrorCode::UnsupportedInput,
                                        "collection " + session.collection.substr(0, 10) +
                                        " is already being received by " + other_id);
                }
            }
        }
        session_id = generate_session_id("recv");
        receives_[session_id] = session;
    }
    
    LOG_INFO("Starting receive {}", session_id);
    
    runtime_->post([this, session_id, session, ticket]() {
        transfer::receive(ticket, *session.events, options_, session.cancel.get());
        session.events->close();
        
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        receives_.erase(session_id);
    });
    
    return ReceiveSessionInfo{session_id, session.events};
}

bool TransferManager::cancel_receive(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = receives_.find(session_id);
    if (it == receives_.end()) {
        return false;
    }
    
    LOG_INFO("Cancelling receive {}", session_id);
    it->second.cancel->cancel();
    return true;
}

std::vector<std::string> TransferManager::active_sends() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    
    std::vector<std::string> ids;
    for (const auto& [session_id, session] : sends_) {
        ids.push_back(session_id);
    }
    return ids;
}

std::vector<std::string> TransferManager::active_receives() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    
    std::vector<std::string> ids;
    for (const auto& [session_id, session] : receives_) {
        ids.push_back(session_id);
    }
    return ids;
}

std::shared_ptr<SendHandle> TransferManager::get_handle(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sends_.find(session_id);
    return it != sends_.end() ? it->second->handle : nullptr;
}

bool TransferManager::has_http_send() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return http_session_.has_value();
}

void TransferManager::shutdown() {
    std::vector<std::shared_ptr<SendChannel>> channels;
    std::vector<std::shared_ptr<SendHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        
        for (auto& [session_id, session] : sends_) {
            channels.push_back(session->events);
            if (session->handle) {
                handles.push_back(session->handle);
            }
        }
        sends_.clear();
        http_session_.reset();
        
        for (auto& [session_id, session] : receives_) {
            session.cancel->cancel();
            session.events->close();
        }
    }
    
    // Unblocks sessions waiting on a full channel
    for (auto& events : channels) {
        events->close();
    }
    
    std::vector<std::shared_future<void>> closing;
    for (auto& handle : handles) {
        closing.push_back(handle->close());
    }
    
    runtime_->shutdown();
    for (auto& pending : closing) {
        pending.wait();
    }
    LOG_INFO("Transfer manager stopped");
}

std::string TransferManager::generate_session_id(const char* prefix) {
    return fmt::format("{}_{:08x}", prefix, static_cast<std::uint32_t>(crypto::SecureRandom::generate_uint64()));
}

}
