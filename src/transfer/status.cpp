#include "beamdrop/transfer/status.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/utils.hpp"
#include <type_traits>

namespace beamdrop::transfer {

using core::utils::StringUtils;

namespace {
    template<typename>
    inline constexpr bool always_false = false;
}

std::string describe(const SendStatus& status) {
    return std::visit([](const auto& event) -> std::string {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, send_status::Connecting>) {
            return "connecting";
        } else if constexpr (std::is_same_v<T, send_status::Importing>) {
            return "importing " + std::to_string(event.done_files) + "/" + std::to_string(event.total_files) +
                   " files (" + StringUtils::format_bytes(event.done_size) + " of " +
                   StringUtils::format_bytes(event.total_size) + ")";
        } else if constexpr (std::is_same_v<T, send_status::ReadyToSend>) {
            return "ready: " + event.ticket;
        } else if constexpr (std::is_same_v<T, send_status::Done>) {
            return "done";
        } else if constexpr (std::is_same_v<T, send_status::Error>) {
            return "error: " + event.message;
        } else {
            static_assert(always_false<T>, "unhandled send status");
        }
    }, status);
}

std::string describe(const ReceiveStatus& status) {
    return std::visit([](const auto& event) -> std::string {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, receive_status::Connecting>) {
            return "connecting";
        } else if constexpr (std::is_same_v<T, receive_status::Connected>) {
            return "connected: " + std::to_string(event.total_files) + " files, " +
                   StringUtils::format_bytes(event.total_size);
        } else if constexpr (std::is_same_v<T, receive_status::Downloading>) {
            return "downloading " + StringUtils::format_bytes(event.downloaded) + " of " +
                   StringUtils::format_bytes(event.total);
        } else if constexpr (std::is_same_v<T, receive_status::Exporting>) {
            return "exporting " + std::to_string(event.done_files) + "/" + std::to_string(event.total_files);
        } else if constexpr (std::is_same_v<T, receive_status::Done>) {
            return "done";
        } else if constexpr (std::is_same_v<T, receive_status::Error>) {
            return "error: " + event.message;
        } else {
            static_assert(always_false<T>, "unhandled receive status");
        }
    }, status);
}

bool is_terminal(const SendStatus& status) {
    return std::holds_alternative<send_status::Done>(status) ||
           std::holds_alternative<send_status::Error>(status);
}

bool is_terminal(const ReceiveStatus& status) {
    return std::holds_alternative<receive_status::Done>(status) ||
           std::holds_alternative<receive_status::Error>(status);
}

void emit(SendChannel& channel, SendStatus status) {
    if (!channel.send(std::move(status))) {
        throw core::TransferError(core::ErrorCode::ChannelClosed, "status channel closed");
    }
}

void emit(ReceiveChannel& channel, ReceiveStatus status) {
    if (!channel.send(std::move(status))) {
        throw core::TransferError(core::ErrorCode::ChannelClosed, "status channel closed");
    }
}

}
