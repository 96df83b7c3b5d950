#include "seedkeeper/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace seedkeeper::core {

CommandRegistry::CommandRegistry() {
    register_command("status", std::make_unique<StatusCommandHandler>());
    register_command("history", std::make_unique<HistoryCommandHandler>());
    register_command("protected", std::make_unique<ProtectedCommandHandler>());
    register_command("check-config", std::make_unique<CheckConfigCommandHandler>());
    register_command("protect", std::make_unique<ProtectionCommandHandler>(true));
    register_command("unprotect", std::make_unique<ProtectionCommandHandler>(false));
    register_command("delete", std::make_unique<DeleteCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const CommandContext& context,
                                               const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    return it->second->execute(context, args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(15) << name 
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(15) << " " 
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

} // namespace seedkeeper::core
