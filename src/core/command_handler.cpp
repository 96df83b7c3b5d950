#include "seedkeeper/core/command_handler.hpp"
#include "seedkeeper/core/config.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"
#include "seedkeeper/cleanup/cleanup_rules.hpp"
#include "seedkeeper/cleanup/directive_file.hpp"
#include "seedkeeper/storage/state_store.hpp"
#include <algorithm>
#include <charconv>
#include <iomanip>

namespace seedkeeper::core {

using utils::FileUtils;
using utils::StringUtils;
using utils::TimeUtils;

namespace {

// Opens the daemon's database without creating one.
std::unique_ptr<storage::StateStore> open_store(const CommandContext& context, std::string& error) {
    const auto& path = context.settings->database_path;
    if (!FileUtils::exists(path)) {
        error = "no state database at " + path.string();
        return nullptr;
    }
    
    auto store = std::make_unique<storage::StateStore>(path);
    auto result = store->initialize();
    if (!result) {
        error = "cannot open " + path.string() + ": " + result.message;
        return nullptr;
    }
    return store;
}

CommandResult queue_directive(const CommandContext& context, const cleanup::Directive& directive) {
    cleanup::DirectiveFile file(context.settings->cleanup_directive_file);
    if (!file.append(directive)) {
        return CommandResult::error("cannot write directive file " + file.path().string());
    }
    
    LOG_INFO("Queued {} directive for {}", cleanup::to_string(directive.action), directive.hash);
    *context.out << "Queued " << cleanup::to_string(directive.action) << " of "
                 << StringUtils::short_hash(directive.hash) << " in " << file.path().string() << "\n";
    return CommandResult::ok();
}

} // namespace

CommandResult StatusCommandHandler::execute(const CommandContext& context, const std::vector<std::string>& /*args*/) {
    auto& out = *context.out;
    std::string error;
    auto store = open_store(context, error);
    if (!store) {
        out << "No state recorded yet (" << error << ")\n";
        return CommandResult::ok();
    }
    
    out << "seedkeeper state (" << context.settings->database_path.string() << ")\n";
    auto state = store->load_controller_state();
    if (state) {
        out << "  Upload limit:   " << StringUtils::format_speed(static_cast<double>(state->limit_bytes_per_sec)) << "\n";
        out << "  Integral term:  " << std::fixed << std::setprecision(3) << state->integral_term << "\n";
        out << "  Estimate:       " << state->kalman_estimate
            << " (covariance " << state->kalman_covariance << ")\n";
        out << "  Last tick:      "
            << (state->last_tick_at ? TimeUtils::format_timestamp(*state->last_tick_at) : "never") << "\n";
    } else {
        out << "  Controller has not run yet\n";
    }
    
    out << "  Protected:      " << store->protected_count() << " transfer(s)\n";
    
    auto recent = store->recent_actions(1);
    if (!recent.empty()) {
        const auto& last = recent.front();
        out << "  Last action:    " << last.action << " " << (last.name.empty() ? last.hash : last.name)
            << " at " << TimeUtils::format_timestamp(last.at) << "\n";
    }
    
    if (FileUtils::exists(context.settings->cleanup_directive_file)) {
        out << "  Directives waiting in " << context.settings->cleanup_directive_file.string() << "\n";
    }
    return CommandResult::ok();
}

CommandResult HistoryCommandHandler::execute(const CommandContext& context, const std::vector<std::string>& args) {
    size_t count = DEFAULT_ENTRIES;
    if (args.size() > 1) {
        const auto& text = args[1];
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
        if (ec != std::errc() || end != text.data() + text.size() || count == 0) {
            return CommandResult::error("Usage: " + get_usage());
        }
    }
    
    std::string error;
    auto store = open_store(context, error);
    if (!store) {
        return CommandResult::error(error);
    }
    
    auto& out = *context.out;
    auto entries = store->recent_actions(count);
    if (entries.empty()) {
        out << "No actions recorded\n";
        return CommandResult::ok();
    }
    
    for (const auto& entry : entries) {
        out << TimeUtils::format_timestamp(entry.at) << "  "
            << std::left << std::setw(10) << entry.action
            << StringUtils::short_hash(entry.hash, 12) << "  "
            << (entry.name.empty() ? "-" : entry.name);
        if (!entry.reason.empty()) {
            out << "  [" << entry.reason << "]";
        }
        if (entry.delete_files) {
            out << "  (with data)";
        }
        out << "\n";
    }
    return CommandResult::ok();
}

CommandResult ProtectedCommandHandler::execute(const CommandContext& context, const std::vector<std::string>& /*args*/) {
    std::string error;
    auto store = open_store(context, error);
    if (!store) {
        return CommandResult::error(error);
    }
    
    auto& out = *context.out;
    auto hashes = store->protected_hashes();
    std::vector<std::string> sorted(hashes.begin(), hashes.end());
    std::sort(sorted.begin(), sorted.end());
    
    out << sorted.size() << " protected transfer(s)\n";
    for (const auto& hash : sorted) {
        out << "  " << hash << "\n";
    }
    return CommandResult::ok();
}

CommandResult CheckConfigCommandHandler::execute(const CommandContext& context, const std::vector<std::string>& /*args*/) {
    auto& out = *context.out;
    
    Config config;
    config.set_defaults();
    if (!context.config_file.empty() && FileUtils::exists(context.config_file)) {
        if (!config.load_from_file(context.config_file.string())) {
            return CommandResult::error("cannot read " + context.config_file.string(), 2);
        }
        out << "Checking " << context.config_file.string() << "\n";
    } else {
        out << "No configuration file, checking defaults\n";
    }
    
    std::string error;
    auto settings = Settings::from_config(config, error);
    if (!settings) {
        return CommandResult::error("invalid configuration: " + error, 2);
    }
    
    out << "  Upload limit range: " << StringUtils::format_speed(static_cast<double>(settings->min_upload_speed))
        << " .. " << StringUtils::format_speed(static_cast<double>(settings->max_upload_speed)) << "\n";
    out << "  Set-point:          " << settings->target_buffer_size << "\n";
    out << "  PID gains:          kp=" << settings->pid_kp << " ki=" << settings->pid_ki
        << " kd=" << settings->pid_kd << "\n";
    out << "  Cleanup:            " << (settings->cleanup_enabled ? "enabled" : "disabled")
        << ", every " << StringUtils::format_duration(settings->cleanup_interval) << "\n";
    out << "  Rules:              " << cleanup::CleanupRules::from_settings(*settings).serialize() << "\n";
    out << "Configuration OK\n";
    return CommandResult::ok("configuration valid");
}

std::string ProtectionCommandHandler::get_description() const {
    return protect_ ? "Exempt a transfer from deletion" : "Remove a deletion exemption";
}

std::string ProtectionCommandHandler::get_usage() const {
    return protect_ ? "seedkeeper protect <hash>" : "seedkeeper unprotect <hash>";
}

CommandResult ProtectionCommandHandler::execute(const CommandContext& context, const std::vector<std::string>& args) {
    if (args.size() < 2 || StringUtils::trim(args[1]).empty()) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    cleanup::Directive directive;
    directive.action = protect_ ? cleanup::DirectiveAction::PROTECT : cleanup::DirectiveAction::UNPROTECT;
    directive.hash = StringUtils::trim(args[1]);
    return queue_directive(context, directive);
}

CommandResult DeleteCommandHandler::execute(const CommandContext& context, const std::vector<std::string>& args) {
    if (args.size() < 2 || StringUtils::trim(args[1]).empty()) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    cleanup::Directive directive;
    directive.action = cleanup::DirectiveAction::DELETE;
    directive.hash = StringUtils::trim(args[1]);
    if (context.delete_files) {
        directive.delete_files = true;
    }
    if (args.size() > 2) {
        std::vector<std::string> words(args.begin() + 2, args.end());
        directive.reason = StringUtils::join(words, " ");
    }
    return queue_directive(context, directive);
}

} // namespace seedkeeper::core
