#include "seedkeeper/scheduler/event_channel.hpp"
#include "seedkeeper/core/logger.hpp"

namespace seedkeeper::scheduler {

const char* to_string(EventSeverity severity) {
    switch (severity) {
        case EventSeverity::INFO: return "info";
        case EventSeverity::WARNING: return "warning";
        case EventSeverity::ERROR: return "error";
    }
    return "info";
}

EventChannel::EventChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void EventChannel::publish(Event event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.size() >= capacity_) {
        events_.pop_front();
        dropped_++;
    }
    events_.push_back(std::move(event));
}

void EventChannel::publish(EventSeverity severity, std::string source, std::string message) {
    LOG_DEBUG("Event [{}] {}: {}", to_string(severity), source, message);
    publish(Event{std::chrono::system_clock::now(), severity, std::move(source), std::move(message)});
}

bool EventChannel::try_pop(Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return false;
    }
    event = std::move(events_.front());
    events_.pop_front();
    return true;
}

std::vector<Event> EventChannel::drain(size_t max_events) {
    std::vector<Event> drained;
    std::lock_guard<std::mutex> lock(mutex_);
    while (!events_.empty() && drained.size() < max_events) {
        drained.push_back(std::move(events_.front()));
        events_.pop_front();
    }
    return drained;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

uint64_t EventChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace seedkeeper::scheduler
