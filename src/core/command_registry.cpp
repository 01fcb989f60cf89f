#include "chunkvault/core/command_registry.hpp"
#include "chunkvault/core/cli.hpp"
#include <iostream>
#include <iomanip>

namespace chunkvault::core {

CommandRegistry::CommandRegistry(const CommandLineParser& parser) {
    register_command("put", std::make_unique<PutCommandHandler>(parser.get_option("type"),
                                                                parser.get_option("owner")));
    register_command("get", std::make_unique<GetCommandHandler>());
    register_command("rm", std::make_unique<RemoveCommandHandler>());
    register_command("ls", std::make_unique<ListCommandHandler>());
    register_command("info", std::make_unique<InfoCommandHandler>());
    register_command("stats", std::make_unique<StatsCommandHandler>());
    register_command("gc", std::make_unique<GcCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(10) << name 
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(10) << " " 
                  << "Usage: " << handler->get_usage() << "\n";
    }
}

}
