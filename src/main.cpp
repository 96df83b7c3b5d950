#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/config.hpp"
#include "seedkeeper/core/cli.hpp"
#include "seedkeeper/core/settings.hpp"
#include "seedkeeper/core/utils.hpp"
#include "seedkeeper/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    std::string parse_error;
    auto line = seedkeeper::core::CommandLineParser::parse(argc, argv, parse_error);
    if (!line) {
        std::cerr << "Error: " << parse_error << "\n\n";
        seedkeeper::core::CommandLineParser::print_usage(std::cerr);
        return 1;
    }
    
    if (line->show_help) {
        seedkeeper::core::CommandLineParser::print_usage(std::cout);
        seedkeeper::core::CommandRegistry().print_help();
        return 0;
    }
    
    if (line->show_version) {
        seedkeeper::core::CommandLineParser::print_version(std::cout);
        return 0;
    }
    
    auto& config = seedkeeper::core::Config::instance();
    config.set_defaults();
    
    auto config_file = seedkeeper::core::utils::FileUtils::expand_home(line->config_file);
    if (seedkeeper::core::utils::FileUtils::exists(config_file) &&
        !config.load_from_file(config_file.string())) {
        std::cerr << "Error: cannot read " << config_file.string() << "\n";
        return 2;
    }
    
    seedkeeper::core::CommandRegistry command_registry;
    
    const auto& args = line->args;
    if (args.empty()) {
        seedkeeper::core::CommandLineParser::print_usage(std::cout);
        command_registry.print_help();
        return 0;
    }
    
    const std::string& command = line->command();
    
    std::string error;
    auto settings = seedkeeper::core::Settings::from_config(config, error);
    if (!settings && command != "check-config") {
        std::cerr << "Error: invalid configuration: " << error << "\n";
        return 2;
    }
    
    auto log_level = seedkeeper::core::Logger::parse_level(settings ? settings->log_level : "info")
        .value_or(seedkeeper::core::LogLevel::Info);
    if (line->verbose) {
        log_level = seedkeeper::core::LogLevel::Debug;
    }
    seedkeeper::core::Logger::initialize(settings ? settings->log_file : "seedkeeper.log", log_level);
    
    LOG_DEBUG("seedkeeper {} starting", command);
    
    seedkeeper::core::CommandContext context;
    context.settings = std::make_shared<const seedkeeper::core::Settings>(
        settings ? std::move(*settings) : seedkeeper::core::Settings{});
    context.config_file = config_file;
    context.delete_files = line->delete_files;
    
    auto result = command_registry.execute_command(command, context, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    seedkeeper::core::Logger::shutdown();
    return result.exit_code;
}
