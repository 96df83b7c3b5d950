#pragma once

#include "seedkeeper/cleanup/cleanup_service.hpp"
#include "seedkeeper/control/rate_control_service.hpp"
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace seedkeeper::scheduler {

enum class CommandType {
    STATUS,
    SPEED,
    LIST,
    START_CONTROLLER,
    STOP_CONTROLLER,
    START_CLEANUP,
    STOP_CLEANUP,
    RELOAD,
    PROTECT,
    UNPROTECT,
    DELETE,
    LOG
};

const char* to_string(CommandType type);
std::optional<CommandType> parse_command_type(const std::string& name);

struct Command {
    CommandType type = CommandType::STATUS;
    std::string target;                 // hash or name pattern
    std::optional<bool> delete_files;
    std::string reason;
    size_t count = 20;                  // log lines
    
    static Command of(CommandType type) {
        Command command;
        command.type = type;
        return command;
    }
};

struct SchedulerStatus {
    control::ControllerStatus controller;
    cleanup::CleanupStatus cleanup;
    size_t protected_count = 0;
    bool store_degraded = false;
    uint64_t settings_generation = 0;
    bool authenticated = false;
    size_t events_pending = 0;
    std::chrono::system_clock::time_point taken_at;
};

struct CommandReply {
    bool ok = true;
    std::string message;
    std::vector<std::string> lines;
    SchedulerStatus status;
};

// Bounded FIFO between command producers (chat side, tests) and the
// scheduler's intake task. A full queue rejects instead of blocking.
class CommandQueue {
public:
    struct Entry {
        Command command;
        std::promise<CommandReply> reply;
    };
    
    explicit CommandQueue(size_t capacity = 64);
    
    std::future<CommandReply> submit(Command command);
    bool try_pop(Entry& entry);
    
    // Rejects everything queued; used at shutdown.
    void close(const std::string& reason);
    
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Entry> entries_;
    bool closed_ = false;
};

} // namespace seedkeeper::scheduler
