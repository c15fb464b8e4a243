#include "beamdrop/core/error.hpp"

namespace beamdrop::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPathComponent: return "invalid path component";
        case ErrorCode::InvalidEncoding: return "invalid encoding";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::WalkError: return "walk error";
        case ErrorCode::ImportError: return "import error";
        case ErrorCode::ExportError: return "export error";
        case ErrorCode::DestinationExists: return "destination exists";
        case ErrorCode::InvalidTicket: return "invalid ticket";
        case ErrorCode::InvalidHash: return "invalid hash";
        case ErrorCode::UnsupportedInput: return "unsupported input";
        case ErrorCode::StoreError: return "store error";
        case ErrorCode::TransportError: return "transport error";
        case ErrorCode::ProtocolError: return "protocol error";
        case ErrorCode::TunnelAuthError: return "tunnel authentication error";
        case ErrorCode::TunnelError: return "tunnel error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ChannelClosed: return "channel closed";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown error";
}

namespace {
    std::string describe(ErrorCode code, const std::string& name, const std::string& cause) {
        switch (code) {
            case ErrorCode::ImportError:
                return "error importing " + name + ": " + cause;
            case ErrorCode::ExportError:
                return "error exporting " + name + ": " + cause;
            default:
                return std::string(to_string(code)) + " (" + name + "): " + cause;
        }
    }
}

ItemError::ItemError(ErrorCode code, std::string name, const std::string& cause)
    : TransferError(code, describe(code, name, cause))
    , name_(std::move(name))
    , cause_(cause) {
}

}
