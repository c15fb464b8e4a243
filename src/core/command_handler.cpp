#include "beamdrop/core/command_handler.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"
#include "beamdrop/core/utils.hpp"
#include "beamdrop/network/tunnel.hpp"
#include "beamdrop/transfer/transfer_manager.hpp"
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <functional>
#include <iostream>
#include <thread>
#include <type_traits>

namespace beamdrop::core {

using utils::StringUtils;

namespace {
    // Runs a callback on SIGINT or SIGTERM for as long as it is alive.
    class InterruptWatcher {
    public:
        explicit InterruptWatcher(std::function<void()> on_interrupt)
            : signals_(io_context_, SIGINT, SIGTERM) {
            signals_.async_wait([callback = std::move(on_interrupt)](const boost::system::error_code& ec, int signal) {
                if (!ec) {
                    LOG_INFO("Received signal {}, stopping", signal);
                    callback();
                }
            });
            thread_ = std::thread([this]() { io_context_.run(); });
        }
        
        ~InterruptWatcher() {
            io_context_.stop();
            if (thread_.joinable()) {
                thread_.join();
            }
        }
    
    private:
        boost::asio::io_context io_context_;
        boost::asio::signal_set signals_;
        std::thread thread_;
    };
    
    CommandResult run_send(transfer::TransferManager& manager, const transfer::SendSessionInfo& session) {
        ProgressPrinter printer(std::cout);
        InterruptWatcher watcher([&manager, id = session.session_id]() { manager.cancel(id); });
        
        std::optional<std::string> failure;
        while (auto status = session.events->recv()) {
            printer.print(*status);
            if (auto* error = std::get_if<transfer::send_status::Error>(&*status)) {
                failure = error->message;
            }
        }
        
        if (failure) {
            return CommandResult::error(*failure);
        }
        return CommandResult::ok("Transfer closed");
    }
}

ProgressPrinter::ProgressPrinter(std::ostream& out)
    : out_(out) {
}

void ProgressPrinter::print(const transfer::SendStatus& status) {
    std::visit([this, &status](const auto& event) {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, transfer::send_status::Importing>) {
            out_ << "\rImporting " << event.done_files << "/" << event.total_files << " files, "
                 << StringUtils::format_bytes(event.done_size) << " of "
                 << StringUtils::format_bytes(event.total_size) << std::flush;
        } else if constexpr (std::is_same_v<T, transfer::send_status::ReadyToSend>) {
            out_ << "\n\nReady. Give this to the receiver:\n\n  " << event.ticket << "\n\n"
                 << "Press Ctrl+C to stop sharing.\n";
        } else if constexpr (std::is_same_v<T, transfer::send_status::Done>) {
            out_ << "Stopped sharing.\n";
        } else {
            out_ << transfer::describe(status) << "\n";
        }
    }, status);
}

void ProgressPrinter::print(const transfer::ReceiveStatus& status) {
    std::visit([this, &status](const auto& event) {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, transfer::receive_status::Connected>) {
            out_ << "Connected: " << event.total_files << " files, "
                 << StringUtils::format_bytes(event.total_size) << "\n";
        } else if constexpr (std::is_same_v<T, transfer::receive_status::Downloading>) {
            auto percent = event.total == 0 ? 100.0 : 100.0 * static_cast<double>(event.downloaded) /
                                                      static_cast<double>(event.total);
            out_ << "\rDownloading " << StringUtils::format_bytes(event.downloaded) << " of "
                 << StringUtils::format_bytes(event.total) << " (" << static_cast<int>(percent) << "%)"
                 << std::flush;
        } else if constexpr (std::is_same_v<T, transfer::receive_status::Exporting>) {
            out_ << "\rWriting " << event.done_files << "/" << event.total_files << " files" << std::flush;
        } else if constexpr (std::is_same_v<T, transfer::receive_status::Done>) {
            out_ << "\nTransfer complete.\n";
        } else {
            out_ << transfer::describe(status) << "\n";
        }
    }, status);
}

SendCommandHandler::SendCommandHandler(transfer::TransferOptions options)
    : options_(std::move(options)) {
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path path = args[1];
    LOG_INFO("Sending {}", path.string());
    
    try {
        transfer::TransferManager manager(options_);
        return run_send(manager, manager.start_send(path));
    } catch (const std::exception& e) {
        return CommandResult::error(e.what());
    }
}

ShareCommandHandler::ShareCommandHandler(transfer::TransferOptions options,
                                         std::shared_ptr<network::TunnelConnector> connector)
    : options_(std::move(options))
    , connector_(std::move(connector)) {
}

CommandResult ShareCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path path = args[1];
    LOG_INFO("Publishing {} through a web link", path.string());
    
    try {
        transfer::TransferManager manager(options_, connector_);
        return run_send(manager, manager.start_http_send(path));
    } catch (const std::exception& e) {
        return CommandResult::error(e.what());
    }
}

ReceiveCommandHandler::ReceiveCommandHandler(transfer::TransferOptions options)
    : options_(std::move(options)) {
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    if (!options_.output_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(options_.output_dir, ec);
        if (ec) {
            return CommandResult::error("Cannot create output directory " + options_.output_dir.string() +
                                        ": " + ec.message());
        }
    }
    
    try {
        transfer::TransferManager manager(options_);
        auto session = manager.receive(args[1]);
        
        ProgressPrinter printer(std::cout);
        InterruptWatcher watcher([&manager, id = session.session_id]() { manager.cancel_receive(id); });
        
        std::optional<std::string> failure;
        while (auto status = session.events->recv()) {
            printer.print(*status);
            if (auto* error = std::get_if<transfer::receive_status::Error>(&*status)) {
                failure = error->message;
            }
        }
        
        if (failure) {
            return CommandResult::error(*failure);
        }
        return CommandResult::ok("Transfer received");
    } catch (const std::exception& e) {
        return CommandResult::error(e.what());
    }
}

}
