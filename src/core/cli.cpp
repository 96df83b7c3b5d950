#include "seedkeeper/core/cli.hpp"
#include <iomanip>
#include <ostream>

namespace seedkeeper::core {

namespace {

enum class Flag { CONFIG, VERBOSE, DELETE_FILES, HELP, VERSION };

struct OptionSpec {
    Flag flag;
    char short_name;
    const char* long_name;
    const char* value_name;
    const char* description;
};

const OptionSpec OPTIONS[] = {
    {Flag::CONFIG, 'c', "config", "FILE", "Configuration file (default: seedkeeper.conf)"},
    {Flag::VERBOSE, '\0', "verbose", nullptr, "Log at debug level"},
    {Flag::DELETE_FILES, '\0', "delete-files", nullptr, "delete: remove downloaded data as well"},
    {Flag::HELP, 'h', "help", nullptr, "Show this help"},
    {Flag::VERSION, 'v', "version", nullptr, "Show version"},
};

const OptionSpec* find_long(const std::string& name) {
    for (const auto& option : OPTIONS) {
        if (name == option.long_name) return &option;
    }
    return nullptr;
}

const OptionSpec* find_short(char name) {
    for (const auto& option : OPTIONS) {
        if (option.short_name != '\0' && name == option.short_name) return &option;
    }
    return nullptr;
}

void apply(const OptionSpec& option, const std::string& value, CommandLine& line) {
    switch (option.flag) {
        case Flag::CONFIG: line.config_file = value; break;
        case Flag::VERBOSE: line.verbose = true; break;
        case Flag::DELETE_FILES: line.delete_files = true; break;
        case Flag::HELP: line.show_help = true; break;
        case Flag::VERSION: line.show_version = true; break;
    }
}

} // namespace

const std::string& CommandLine::command() const {
    static const std::string none;
    return args.empty() ? none : args.front();
}

std::optional<CommandLine> CommandLineParser::parse(int argc, char* argv[], std::string& error) {
    std::vector<std::string> words;
    for (int i = 0; i < argc; ++i) {
        words.emplace_back(argv[i]);
    }
    return parse(words, error);
}

std::optional<CommandLine> CommandLineParser::parse(const std::vector<std::string>& argv, std::string& error) {
    CommandLine line;
    bool options_done = false;
    
    for (size_t i = 1; i < argv.size(); ++i) {
        const auto& word = argv[i];
        
        if (options_done || word.size() < 2 || word[0] != '-') {
            line.args.push_back(word);
            continue;
        }
        if (word == "--") {
            options_done = true;
            continue;
        }
        
        const OptionSpec* option = nullptr;
        std::optional<std::string> inline_value;
        if (word.starts_with("--")) {
            auto eq = word.find('=');
            option = find_long(word.substr(2, eq == std::string::npos ? std::string::npos : eq - 2));
            if (eq != std::string::npos) {
                inline_value = word.substr(eq + 1);
            }
        } else if (word.size() == 2) {
            option = find_short(word[1]);
        }
        
        if (!option) {
            error = "Unknown option: " + word;
            return std::nullopt;
        }
        
        std::string value;
        if (option->value_name) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < argv.size()) {
                value = argv[++i];
            }
            if (value.empty()) {
                error = "Option --" + std::string(option->long_name) + " requires a " + option->value_name;
                return std::nullopt;
            }
        } else if (inline_value) {
            error = "Option --" + std::string(option->long_name) + " takes no value";
            return std::nullopt;
        }
        apply(*option, value, line);
    }
    
    return line;
}

void CommandLineParser::print_usage(std::ostream& out) {
    out << "Usage: seedkeeper [options] <command> [args...]\n\nOptions:\n";
    for (const auto& option : OPTIONS) {
        std::string names = option.short_name ? std::string("-") + option.short_name + ", " : "    ";
        names += "--" + std::string(option.long_name);
        if (option.value_name) {
            names += " " + std::string(option.value_name);
        }
        out << "  " << std::left << std::setw(24) << names << option.description << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) {
    out << "seedkeeper version 0.3.0\n";
}

} // namespace seedkeeper::core
