#pragma once

#include "beamdrop/core/event_channel.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace beamdrop::transfer {

namespace send_status {
    struct Connecting {};
    
    struct Importing {
        std::uint64_t total_files = 0;
        std::uint64_t done_files = 0;
        std::uint64_t total_size = 0;
        std::uint64_t done_size = 0;
    };
    
    // Ticket string for P2P sends, download URL for HTTP sends
    struct ReadyToSend {
        std::string ticket;
    };
    
    struct Done {};
    
    struct Error {
        std::string message;
    };
}

namespace receive_status {
    struct Connecting {};
    
    struct Connected {
        std::uint64_t total_files = 0;
        std::uint64_t total_size = 0;
    };
    
    struct Downloading {
        std::uint64_t downloaded = 0;
        std::uint64_t total = 0;
    };
    
    struct Exporting {
        std::uint64_t total_files = 0;
        std::uint64_t done_files = 0;
    };
    
    struct Done {};
    
    struct Error {
        std::string message;
    };
}

using SendStatus = std::variant<send_status::Connecting, send_status::Importing,
                                send_status::ReadyToSend, send_status::Done, send_status::Error>;

using ReceiveStatus = std::variant<receive_status::Connecting, receive_status::Connected,
                                   receive_status::Downloading, receive_status::Exporting,
                                   receive_status::Done, receive_status::Error>;

using SendChannel = core::EventChannel<SendStatus>;
using ReceiveChannel = core::EventChannel<ReceiveStatus>;

std::string describe(const SendStatus& status);
std::string describe(const ReceiveStatus& status);

bool is_terminal(const SendStatus& status);
bool is_terminal(const ReceiveStatus& status);

// Pushes an event into a session channel. Throws TransferError(ChannelClosed)
// when the consumer has gone away so the session can abort.
void emit(SendChannel& channel, SendStatus status);
void emit(ReceiveChannel& channel, ReceiveStatus status);

}
