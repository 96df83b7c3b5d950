#include "seedkeeper/core/logger.hpp"
#include "seedkeeper/core/utils.hpp"
#include <spdlog/pattern_formatter.h>

namespace seedkeeper::core {

namespace {

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto logger = std::make_shared<spdlog::logger>(
        "seedkeeper-console", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_;
std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> Logger::recent_sink_;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, 1048576 * 10, 3);
    file_sink->set_level(spdlog::level::debug);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
    
    recent_sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(RECENT_CAPACITY);
    recent_sink_->set_level(spdlog::level::info);
    recent_sink_->set_pattern("%H:%M:%S [%L] %v");
    
    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink, recent_sink_};
    logger_ = std::make_shared<spdlog::logger>("seedkeeper", sinks.begin(), sinks.end());
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    
    LOG_INFO("Logger initialized with level: {}", static_cast<int>(level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();
        // spdlog::shutdown() would leave no default logger for late LOG_* calls.
        spdlog::drop_all();
        spdlog::set_default_logger(make_console_logger());
        logger_.reset();
        recent_sink_.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    if (auto fallback = spdlog::default_logger()) {
        return fallback;
    }
    static auto console = make_console_logger();
    return console;
}

std::vector<std::string> Logger::recent(size_t count) {
    if (!recent_sink_) {
        return {};
    }
    return recent_sink_->last_formatted(count);
}

std::optional<LogLevel> Logger::parse_level(const std::string& name) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    
    return std::nullopt;
}

}
