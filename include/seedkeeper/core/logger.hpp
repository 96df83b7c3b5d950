#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace seedkeeper::core {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warn = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

class Logger {
public:
    static void initialize(const std::string& log_file, LogLevel level);
    static void shutdown();
    
    // Falls back to the spdlog default logger before initialize() is called.
    static std::shared_ptr<spdlog::logger> get();
    
    // Last formatted lines kept in memory for the "log" command.
    static std::vector<std::string> recent(size_t count);
    
    static std::optional<LogLevel> parse_level(const std::string& name);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> recent_sink_;
    
    static constexpr size_t RECENT_CAPACITY = 200;
};

} // namespace seedkeeper::core

#define SEEDKEEPER_LOG(level, ...) \
    SPDLOG_LOGGER_CALL(::seedkeeper::core::Logger::get(), level, __VA_ARGS__)

#define LOG_TRACE(...) SEEDKEEPER_LOG(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) SEEDKEEPER_LOG(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) SEEDKEEPER_LOG(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) SEEDKEEPER_LOG(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) SEEDKEEPER_LOG(spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) SEEDKEEPER_LOG(spdlog::level::critical, __VA_ARGS__)
