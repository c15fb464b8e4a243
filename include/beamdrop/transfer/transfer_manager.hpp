#pragma once

#include "beamdrop/core/runtime.hpp"
#include "beamdrop/network/tunnel.hpp"
#include "beamdrop/transfer/send_handle.hpp"
#include "beamdrop/transfer/status.hpp"
#include "beamdrop/transfer/transfer_options.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace beamdrop::transfer {

enum class SendKind {
    P2P,
    Http
};

struct SendSessionInfo {
    std::string session_id;
    std::shared_ptr<SendChannel> events;
};

struct ReceiveSessionInfo {
    std::string session_id;
    std::shared_ptr<ReceiveChannel> events;
};

// Registry of running sessions. Every session runs on the shared runtime and
// reports through its own channel; the channel is closed after the session's
// terminal event.
class TransferManager {
public:
    explicit TransferManager(TransferOptions options,
                             std::shared_ptr<network::TunnelConnector> connector = nullptr,
                             std::shared_ptr<core::Runtime> runtime = nullptr);
    ~TransferManager();
    
    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;
    
    SendSessionInfo start_send(const std::filesystem::path& path);
    
    // Only one web link may be active; a second call throws
    // TransferError(UnsupportedInput).
    SendSessionInfo start_http_send(const std::filesystem::path& path);
    
    // Throws TransferError(UnsupportedInput) while another receive of the
    // same collection is in flight.
    ReceiveSessionInfo receive(const std::string& ticket);
    
    // Releases the send and reports Done on its channel. Returns false for an
    // unknown session id.
    bool cancel(const std::string& session_id);
    bool cancel_receive(const std::string& session_id);
    
    std::vector<std::string> active_sends() const;
    std::vector<std::string> active_receives() const;
    std::shared_ptr<SendHandle> get_handle(const std::string& session_id) const;
    bool has_http_send() const;
    
    // Cancels every session, closes their channels and waits for cleanup.
    void shutdown();
    
    const TransferOptions& options() const { return options_; }
    const std::shared_ptr<core::Runtime>& runtime() const { return runtime_; }

private:
    struct SendSession {
        SendKind kind = SendKind::P2P;
        std::filesystem::path path;
        std::shared_ptr<SendChannel> events;
        std::shared_ptr<SendHandle> handle;
    };
    
    struct ReceiveSession {
        std::shared_ptr<ReceiveChannel> events;
        std::shared_ptr<core::CancellationToken> cancel;
        // Hex hash of the requested collection; empty for an unparsable ticket
        std::string collection;
    };
    
    TransferOptions options_;
    std::shared_ptr<network::TunnelConnector> connector_;
    std::shared_ptr<core::Runtime> runtime_;
    
    std::map<std::string, std::shared_ptr<SendSession>> sends_;
    std::map<std::string, ReceiveSession> receives_;
    std::optional<std::string> http_session_;
    bool stopped_;
    mutable std::mutex sessions_mutex_;
    
    SendSessionInfo launch_send(SendKind kind, const std::filesystem::path& path);
    void finish_start(const std::string& session_id, std::shared_ptr<SendSession> session,
                      std::shared_ptr<SendHandle> handle);
    static void finish_cancelled(SendChannel& events, const std::shared_ptr<SendHandle>& handle);
    std::string generate_session_id(const char* prefix);
};

}
