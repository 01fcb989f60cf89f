#include <iostream>
#include <string>
#include <vector>
#include "chunkvault/core/logger.hpp"
#include "chunkvault/core/config.hpp"
#include "chunkvault/core/cli.hpp"
#include "chunkvault/core/utils.hpp"
#include "chunkvault/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    chunkvault::core::CommandLineParser parser("chunkvault");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        chunkvault::core::CommandRegistry(parser).print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = chunkvault::core::Config::instance();
    config.set_defaults();
    
    std::string config_file = parser.get_option("config");
    if (chunkvault::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file)) {
            std::cerr << "Error: cannot read config file " << config_file << "\n";
            return 1;
        }
    }
    
    auto log_level = parser.has_option("verbose") ?
        chunkvault::core::LogLevel::Debug :
        chunkvault::core::Logger::parse_level(config.get_string("log.level", "info"));
    chunkvault::core::Logger::initialize(config.get_string("log.file", "chunkvault.log"), log_level);
    
    chunkvault::core::CommandRegistry command_registry(parser);
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    std::string command = args[0];
    
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    chunkvault::core::Logger::shutdown();
    return result.exit_code;
}
