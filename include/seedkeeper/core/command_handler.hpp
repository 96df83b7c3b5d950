#pragma once

#include "settings.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace seedkeeper::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

// What every operator command gets to work with. The CLI never talks to the
// transfer client; it reads the state database and hands mutations to the
// daemon through the directive file.
struct CommandContext {
    std::shared_ptr<const Settings> settings;
    std::filesystem::path config_file;
    bool delete_files = false;
    std::ostream* out = &std::cout;
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself.
    virtual CommandResult execute(const CommandContext& context, const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class StatusCommandHandler : public CommandHandler {
public:
    CommandResult execute(const CommandContext& context, const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show persisted controller and cleanup state"; }
    std::string get_usage() const override { return "seedkeeper status"; }
};

class HistoryCommandHandler : public CommandHandler {
public:
    static constexpr size_t DEFAULT_ENTRIES = 20;
    
    CommandResult execute(const CommandContext& context, const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show recent cleanup and protection actions"; }
    std::string get_usage() const override { return "seedkeeper history [count]"; }
};

class ProtectedCommandHandler : public CommandHandler {
public:
    CommandResult execute(const CommandContext& context, const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List protected transfers"; }
    std::string get_usage() const override { return "seedkeeper protected"; }
};

class CheckConfigCommandHandler : public CommandHandler {
public:
    CommandResult execute(const CommandContext& context, const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Validate the configuration file"; }
    std::string get_usage() const override { return "seedkeeper check-config"; }
};

// protect / unprotect share one handler; the action is fixed at registration.
class ProtectionCommandHandler : public CommandHandler {
public:
    explicit ProtectionCommandHandler(bool protect) : protect_(protect) {}
    
    CommandResult execute(const CommandContext& context, const std::vector<std::string>& args) override;
    std::string get_description() const override;
    std::string get_usage() const override;

private:
    bool protect_;
};

class DeleteCommandHandler : public CommandHandler {
public:
    CommandResult execute(const CommandContext& context, const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Queue a manual deletion for the running daemon"; }
    std::string get_usage() const override { return "seedkeeper delete <hash> [--delete-files] [reason]"; }
};

} // namespace seedkeeper::core
