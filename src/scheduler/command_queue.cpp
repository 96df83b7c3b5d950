#include "seedkeeper/scheduler/command_queue.hpp"
#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"
#include <unordered_map>

namespace seedkeeper::scheduler {

const char* to_string(CommandType type) {
    switch (type) {
        case CommandType::STATUS: return "status";
        case CommandType::SPEED: return "speed";
        case CommandType::LIST: return "list";
        case CommandType::START_CONTROLLER: return "start_controller";
        case CommandType::STOP_CONTROLLER: return "stop_controller";
        case CommandType::START_CLEANUP: return "start_cleanup";
        case CommandType::STOP_CLEANUP: return "stop_cleanup";
        case CommandType::RELOAD: return "reload";
        case CommandType::PROTECT: return "protect";
        case CommandType::UNPROTECT: return "unprotect";
        case CommandType::DELETE: return "delete";
        case CommandType::LOG: return "log";
    }
    return "status";
}

std::optional<CommandType> parse_command_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> types = {
        {"status", CommandType::STATUS},
        {"speed", CommandType::SPEED},
        {"list", CommandType::LIST},
        {"start_controller", CommandType::START_CONTROLLER},
        {"stop_controller", CommandType::STOP_CONTROLLER},
        {"start_cleanup", CommandType::START_CLEANUP},
        {"stop_cleanup", CommandType::STOP_CLEANUP},
        {"reload", CommandType::RELOAD},
        {"protect", CommandType::PROTECT},
        {"unprotect", CommandType::UNPROTECT},
        {"delete", CommandType::DELETE},
        {"log", CommandType::LOG},
    };
    
    auto it = types.find(core::utils::StringUtils::to_lower(name));
    if (it == types.end()) {
        return std::nullopt;
    }
    return it->second;
}

CommandQueue::CommandQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

std::future<CommandReply> CommandQueue::submit(Command command) {
    Entry entry{std::move(command), std::promise<CommandReply>()};
    auto future = entry.reply.get_future();
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || entries_.size() >= capacity_) {
        CommandReply reply;
        reply.ok = false;
        reply.message = closed_ ? "scheduler is shutting down" : "command queue full";
        LOG_WARN("Command '{}' rejected: {}", to_string(entry.command.type), reply.message);
        entry.reply.set_value(std::move(reply));
        return future;
    }
    
    entries_.push_back(std::move(entry));
    return future;
}

bool CommandQueue::try_pop(Entry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return false;
    }
    entry = std::move(entries_.front());
    entries_.pop_front();
    return true;
}

void CommandQueue::close(const std::string& reason) {
    std::deque<Entry> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        rejected.swap(entries_);
    }
    
    for (auto& entry : rejected) {
        CommandReply reply;
        reply.ok = false;
        reply.message = reason;
        entry.reply.set_value(std::move(reply));
    }
}

size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace seedkeeper::scheduler
