#include "beamdrop/core/command_registry.hpp"
#include <iomanip>
#include <iostream>

namespace beamdrop::core {

CommandRegistry::CommandRegistry(const transfer::TransferOptions& options) {
    register_command("send", std::make_unique<SendCommandHandler>(options));
    register_command("share", std::make_unique<ShareCommandHandler>(options));
    register_command("receive", std::make_unique<ReceiveCommandHandler>(options));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command, 2);
    }
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) > 0;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(10) << " " << "Usage: " << handler->get_usage() << "\n";
    }
}

}
