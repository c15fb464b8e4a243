#pragma once

#include "beamdrop/transfer/status.hpp"
#include "beamdrop/transfer/transfer_options.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace beamdrop::network {
class TunnelConnector;
}

namespace beamdrop::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;
    
    static CommandResult ok(std::string message = "") {
        return CommandResult{true, std::move(message), 0};
    }
    
    static CommandResult error(std::string message, int exit_code = 1) {
        return CommandResult{false, std::move(message), exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Renders session events as single progress lines.
class ProgressPrinter {
public:
    explicit ProgressPrinter(std::ostream& out);
    
    void print(const transfer::SendStatus& status);
    void print(const transfer::ReceiveStatus& status);

private:
    std::ostream& out_;
};

// Shares a file or directory with a peer through a ticket.
class SendCommandHandler : public CommandHandler {
public:
    explicit SendCommandHandler(transfer::TransferOptions options);
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Share a file or directory with a peer"; }
    std::string get_usage() const override { return "beamdrop send <path>"; }

private:
    transfer::TransferOptions options_;
};

// Publishes a single file behind a temporary public download link.
class ShareCommandHandler : public CommandHandler {
public:
    ShareCommandHandler(transfer::TransferOptions options,
                        std::shared_ptr<network::TunnelConnector> connector = nullptr);
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Share one file through a public web link"; }
    std::string get_usage() const override { return "beamdrop share <file>"; }

private:
    transfer::TransferOptions options_;
    std::shared_ptr<network::TunnelConnector> connector_;
};

class ReceiveCommandHandler : public CommandHandler {
public:
    explicit ReceiveCommandHandler(transfer::TransferOptions options);
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download a transfer from a ticket"; }
    std::string get_usage() const override { return "beamdrop receive <ticket> [--output <dir>]"; }

private:
    transfer::TransferOptions options_;
};

}
