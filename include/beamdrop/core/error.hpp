#pragma once

#include <stdexcept>
#include <string>

namespace beamdrop::core {

enum class ErrorCode {
    InvalidPathComponent,
    InvalidEncoding,
    NotFound,
    WalkError,
    ImportError,
    ExportError,
    DestinationExists,
    InvalidTicket,
    InvalidHash,
    UnsupportedInput,
    StoreError,
    TransportError,
    ProtocolError,
    TunnelAuthError,
    TunnelError,
    Timeout,
    ChannelClosed,
    Cancelled
};

const char* to_string(ErrorCode code);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    
    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Wraps a failure that happened while processing one named item.
class ItemError : public TransferError {
public:
    ItemError(ErrorCode code, std::string name, const std::string& cause);
    
    const std::string& name() const noexcept { return name_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    std::string name_;
    std::string cause_;
};

}
