#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace seedkeeper::core {

struct CommandLine {
    std::string config_file = "seedkeeper.conf";
    bool verbose = false;
    bool delete_files = false;
    bool show_help = false;
    bool show_version = false;
    
    // Command name first, then its arguments.
    std::vector<std::string> args;
    
    const std::string& command() const;
};

// Parses `seedkeeper [options] <command> [args...]`. Options may appear
// anywhere; everything after `--` is taken as an argument.
class CommandLineParser {
public:
    static std::optional<CommandLine> parse(int argc, char* argv[], std::string& error);
    static std::optional<CommandLine> parse(const std::vector<std::string>& argv, std::string& error);
    
    static void print_usage(std::ostream& out);
    static void print_version(std::ostream& out);
};

} // namespace seedkeeper::core
