#pragma once

#include "command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chunkvault::core {

class CommandLineParser;

class CommandRegistry {
public:
    // Options such as --type and --owner are read from the parser.
    explicit CommandRegistry(const CommandLineParser& parser);
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    
    bool has_command(const std::string& command) const;
    
    void print_help() const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
